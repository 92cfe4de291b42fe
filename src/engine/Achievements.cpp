#include "engine/Achievements.hpp"

#include <algorithm>
#include <utility>

namespace zf::engine
{

namespace
{

std::int64_t measured_value(Badge const &badge, AggregateState const &state)
{
    switch (badge.requirement)
    {
    case BadgeRequirement::Streak:
        return state.current_streak;
    case BadgeRequirement::TotalMinutes:
        return state.total_minutes;
    }
    return 0;
}

BadgeUnlock const *find_unlock(std::vector<BadgeUnlock> const &unlocks,
                               std::string const &id)
{
    auto it = std::find_if(unlocks.begin(), unlocks.end(),
                           [&id](BadgeUnlock const &unlock)
                           { return unlock.id == id; });
    return it == unlocks.end() ? nullptr : &*it;
}

} // namespace

std::vector<Badge> const &Achievements::default_badges()
{
    static std::vector<Badge> const kBadges = {
        {"week-streak", "Week Warrior", BadgeRequirement::Streak, 7,
         "flame.fill"},
        {"month-streak", "Monthly Master", BadgeRequirement::Streak, 30,
         "bolt.fill"},
        {"first-hour", "First Hour", BadgeRequirement::TotalMinutes, 60,
         "clock.fill"},
        {"mastery", "Dedicated Practitioner", BadgeRequirement::TotalMinutes,
         300, "star.fill"},
        {"zen-master", "Zen Master", BadgeRequirement::TotalMinutes, 1000,
         "crown.fill"},
    };
    return kBadges;
}

bool Achievements::is_met(Badge const &badge, AggregateState const &state)
{
    return measured_value(badge, state) >= badge.required_value;
}

std::vector<BadgeUnlock>
Achievements::newly_unlocked(AggregateState const &state,
                             std::vector<BadgeUnlock> const &existing,
                             Instant now)
{
    std::vector<BadgeUnlock> result;
    for (auto const &badge : default_badges())
    {
        if (find_unlock(existing, badge.id) != nullptr)
        {
            continue;
        }
        if (is_met(badge, state))
        {
            result.push_back(BadgeUnlock{badge.id, now});
        }
    }
    return result;
}

std::vector<BadgeStatus>
Achievements::status(AggregateState const &state,
                     std::vector<BadgeUnlock> const &unlocks)
{
    std::vector<BadgeStatus> result;
    result.reserve(default_badges().size());
    for (auto const &badge : default_badges())
    {
        BadgeStatus entry;
        entry.badge = badge;
        entry.progress_value = measured_value(badge, state);
        if (auto const *unlock = find_unlock(unlocks, badge.id))
        {
            entry.unlocked = true;
            entry.unlocked_at = unlock->unlocked_at;
        }
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace zf::engine
