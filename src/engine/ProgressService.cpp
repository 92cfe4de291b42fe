#include "engine/ProgressService.hpp"

#include "engine/Aggregator.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/SyncGateway.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace zf::engine
{

namespace
{

std::vector<Session> newest_first(std::vector<Session> sessions)
{
    // Later rows win ties on equal timestamps.
    std::reverse(sessions.begin(), sessions.end());
    std::stable_sort(sessions.begin(), sessions.end(),
                     [](Session const &lhs, Session const &rhs)
                     { return lhs.timestamp > rhs.timestamp; });
    return sessions;
}

} // namespace

ProgressService::ProgressService(SyncGateway *gateway, EventBus *bus)
    : gateway_(gateway), bus_(bus), calendar_(gateway->calendar()),
      state_(gateway->load()), unlocks_(gateway->load_badge_unlocks())
{
    ZF_LOG_DEBUG("progress loaded: {} minutes, streak {}, {} sessions",
                 state_.total_minutes, state_.current_streak,
                 state_.total_sessions);
}

ProgressService::RecordResult
ProgressService::record_session(std::int64_t duration_minutes, Instant at)
{
    RecordResult result;
    std::unique_lock<std::mutex> lock(mutex_);
    if (duration_minutes <= 0)
    {
        ZF_LOG_WARN("rejected session with duration {}", duration_minutes);
        result.status = RecordStatus::InvalidDuration;
        result.state = state_;
        return result;
    }

    Session session{at, duration_minutes};
    auto next = Aggregator::apply(state_, session, calendar_);
    auto unlocked = Achievements::newly_unlocked(next, unlocks_, at);
    if (!gateway_->commit_session(session, next, unlocked))
    {
        result.status = RecordStatus::StoreWriteFailed;
        result.state = state_;
        return result;
    }

    state_ = next;
    unlocks_.insert(unlocks_.end(), unlocked.begin(), unlocked.end());
    result.state = state_;
    result.unlocked = std::move(unlocked);
    // Subscribers may read back through this service.
    lock.unlock();
    gateway_->signal_changed();

    ZF_LOG_INFO("recorded {} minute session; total {} minutes, streak {}",
                duration_minutes, result.state.total_minutes,
                result.state.current_streak);
    publish_unlocks(result.unlocked);
    return result;
}

AggregateState ProgressService::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<Session>
ProgressService::sessions(std::optional<std::size_t> limit) const
{
    auto ordered = newest_first(gateway_->load_sessions().sessions);
    if (limit && ordered.size() > *limit)
    {
        ordered.resize(*limit);
    }
    return ordered;
}

std::vector<Session> ProgressService::sessions_between(Instant from,
                                                       Instant to) const
{
    auto ordered = newest_first(gateway_->load_sessions().sessions);
    std::erase_if(ordered, [from, to](Session const &session)
                  { return session.timestamp < from || session.timestamp > to; });
    return ordered;
}

std::vector<Session> ProgressService::sessions_on_day(Instant day) const
{
    auto ordered = newest_first(gateway_->load_sessions().sessions);
    std::erase_if(ordered, [this, day](Session const &session)
                  { return !calendar_.same_day(session.timestamp, day); });
    return ordered;
}

ProgressStatistics ProgressService::statistics(Instant now) const
{
    auto const snapshot = state();
    ProgressStatistics stats;
    stats.total_sessions = snapshot.total_sessions;
    stats.total_minutes = snapshot.total_minutes;
    stats.average_session_minutes =
        snapshot.total_sessions > 0
            ? snapshot.total_minutes / snapshot.total_sessions
            : 0;
    stats.current_streak = snapshot.current_streak;
    stats.longest_streak = snapshot.longest_streak;
    stats.streak_active =
        Aggregator::is_streak_active(snapshot, now, calendar_);
    stats.last_session_date = snapshot.last_session_date;
    return stats;
}

bool ProgressService::is_streak_active(Instant now) const
{
    return Aggregator::is_streak_active(state(), now, calendar_);
}

int ProgressService::effective_streak(Instant now) const
{
    auto const snapshot = state();
    return Aggregator::is_streak_active(snapshot, now, calendar_)
               ? snapshot.current_streak
               : 0;
}

bool ProgressService::recalculate(Instant now)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto history = gateway_->load_sessions();
    if (history.sessions.empty())
    {
        ZF_LOG_INFO("recalculate: no stored sessions, keeping current state");
        return true;
    }

    auto rebuilt = Aggregator::replay(std::move(history.sessions), calendar_);
    rebuilt.total_minutes = std::max(rebuilt.total_minutes, state_.total_minutes);
    rebuilt.total_sessions =
        std::max(rebuilt.total_sessions, state_.total_sessions);
    rebuilt.longest_streak =
        std::max({rebuilt.longest_streak, state_.longest_streak,
                  rebuilt.current_streak});

    auto unlocked = Achievements::newly_unlocked(rebuilt, unlocks_, now);
    if (!gateway_->commit(rebuilt, unlocked))
    {
        return false;
    }
    state_ = rebuilt;
    unlocks_.insert(unlocks_.end(), unlocked.begin(), unlocked.end());
    lock.unlock();
    gateway_->signal_changed();

    ZF_LOG_INFO("recalculated progress: {} minutes, streak {} ({} skipped)",
                rebuilt.total_minutes, rebuilt.current_streak, history.skipped);
    publish_unlocks(unlocked);
    return true;
}

bool ProgressService::clear_history()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!gateway_->clear_sessions())
    {
        return false;
    }
    lock.unlock();
    gateway_->signal_changed();
    ZF_LOG_INFO("session history cleared; statistics kept");
    return true;
}

bool ProgressService::reset_all_data()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!gateway_->reset_all())
    {
        return false;
    }
    state_ = AggregateState{};
    unlocks_.clear();
    lock.unlock();
    gateway_->signal_changed();
    ZF_LOG_INFO("all progress data reset");
    return true;
}

std::vector<BadgeStatus> ProgressService::badges() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return Achievements::status(state_, unlocks_);
}

std::vector<BadgeUnlock> ProgressService::unlocked_badges() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return unlocks_;
}

void ProgressService::publish_unlocks(
    std::vector<BadgeUnlock> const &unlocks) const
{
    if (unlocks.empty())
    {
        return;
    }
    for (auto const &unlock : unlocks)
    {
        ZF_LOG_INFO("badge unlocked: {}", unlock.id);
    }
    if (bus_ != nullptr)
    {
        bus_->publish(BadgesUnlockedEvent{unlocks});
    }
}

} // namespace zf::engine
