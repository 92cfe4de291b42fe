#pragma once

#include "engine/Achievements.hpp"
#include "engine/Calendar.hpp"
#include "engine/Progress.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace zf::engine
{
class EventBus;
class SyncGateway;

// Writer-side owner of the aggregate. Every mutation reads, folds and commits
// under one mutex, then signals once the mutex is released; a failed commit
// leaves the in-memory state untouched and sends no signal.
class ProgressService
{
  public:
    enum class RecordStatus
    {
        Ok,
        InvalidDuration,
        StoreWriteFailed
    };

    struct RecordResult
    {
        RecordStatus status = RecordStatus::Ok;
        AggregateState state;
        std::vector<BadgeUnlock> unlocked;
    };

    // `gateway` must outlive the service. Loads the committed state.
    explicit ProgressService(SyncGateway *gateway, EventBus *bus = nullptr);

    ProgressService(ProgressService const &) = delete;
    ProgressService &operator=(ProgressService const &) = delete;

    RecordResult record_session(std::int64_t duration_minutes,
                                Instant at = now_instant());

    AggregateState state() const;
    // Newest first.
    std::vector<Session>
    sessions(std::optional<std::size_t> limit = std::nullopt) const;
    // Inclusive on both ends, newest first.
    std::vector<Session> sessions_between(Instant from, Instant to) const;
    std::vector<Session> sessions_on_day(Instant day) const;

    ProgressStatistics statistics(Instant now) const;
    bool is_streak_active(Instant now) const;
    // current_streak while the streak is alive, otherwise 0.
    int effective_streak(Instant now) const;

    // Rebuilds the aggregate from the stored history. Totals and the longest
    // streak never go down. An empty history leaves the state alone.
    bool recalculate(Instant now = now_instant());
    bool clear_history();
    bool reset_all_data();

    std::vector<BadgeStatus> badges() const;
    std::vector<BadgeUnlock> unlocked_badges() const;

  private:
    void publish_unlocks(std::vector<BadgeUnlock> const &unlocks) const;

    SyncGateway *gateway_;
    EventBus *bus_;
    Calendar calendar_;
    mutable std::mutex mutex_;
    AggregateState state_;
    std::vector<BadgeUnlock> unlocks_;
};

} // namespace zf::engine
