#pragma once

#include "engine/Progress.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace zf::engine
{

enum class BadgeRequirement
{
    Streak,
    TotalMinutes,
};

struct Badge
{
    std::string id;
    std::string name;
    BadgeRequirement requirement = BadgeRequirement::Streak;
    std::int64_t required_value = 0;
    std::string icon_token;
};

struct BadgeUnlock
{
    std::string id;
    Instant unlocked_at{};

    bool operator==(BadgeUnlock const &) const = default;
};

struct BadgeStatus
{
    Badge badge;
    bool unlocked = false;
    std::optional<Instant> unlocked_at;
    // Current value measured against `badge.required_value`.
    std::int64_t progress_value = 0;
};

class Achievements
{
  public:
    static std::vector<Badge> const &default_badges();

    static bool is_met(Badge const &badge, AggregateState const &state);

    // Badges met by `state` that have no entry in `existing`, stamped with
    // `now`. Order follows the badge table.
    static std::vector<BadgeUnlock>
    newly_unlocked(AggregateState const &state,
                   std::vector<BadgeUnlock> const &existing, Instant now);

    static std::vector<BadgeStatus>
    status(AggregateState const &state,
           std::vector<BadgeUnlock> const &unlocks);
};

} // namespace zf::engine
