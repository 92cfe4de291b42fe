#pragma once

#include "engine/Achievements.hpp"
#include "engine/Calendar.hpp"
#include "engine/ChangeSignal.hpp"
#include "engine/Progress.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace zf::storage
{
class Database;
}

namespace zf::engine
{
class EventBus;

// The only channel between the writer and the widget process: the shared
// SQLite store plus the invalidation broadcast. Falls back to a process-local
// in-memory store when the shared one cannot be opened.
class SyncGateway
{
  public:
    // `bus` and `broadcaster` are optional; without a broadcaster
    // signal_changed() only notifies the bus.
    SyncGateway(std::filesystem::path store_path, Calendar calendar,
                EventBus *bus = nullptr,
                std::unique_ptr<ChangeBroadcaster> broadcaster = nullptr);
    ~SyncGateway();

    SyncGateway(SyncGateway const &) = delete;
    SyncGateway &operator=(SyncGateway const &) = delete;

    bool is_degraded() const noexcept { return degraded_; }
    std::filesystem::path const &store_path() const noexcept
    {
        return store_path_;
    }
    Calendar const &calendar() const noexcept { return calendar_; }

    // Writes every aggregate key and merges `new_unlocks` into the stored
    // badge list inside one transaction. Single logical writer only.
    bool commit(AggregateState const &state,
                std::vector<BadgeUnlock> const &new_unlocks = {});
    // Appends `session` and commits `state` in the same transaction.
    bool commit_session(Session const &session, AggregateState const &state,
                        std::vector<BadgeUnlock> const &new_unlocks = {});

    // Fire-and-forget; failure to reach other processes is logged only.
    // Returns whether the cross-process broadcast was delivered.
    bool signal_changed();

    AggregateState load() const;
    SessionLoad load_sessions() const;
    std::vector<BadgeUnlock> load_badge_unlocks() const;

    // Empties the event store and leaves the aggregate alone.
    bool clear_sessions();
    // Empties the event store, the aggregate and the badge list.
    bool reset_all();

  private:
    bool write_state(AggregateState const &state);
    bool merge_unlocks(std::vector<BadgeUnlock> const &new_unlocks);
    // Callers hold mutex_.
    AggregateState read_state() const;
    SessionLoad read_sessions() const;
    std::vector<BadgeUnlock> read_badge_unlocks() const;

    std::filesystem::path store_path_;
    Calendar calendar_;
    EventBus *bus_ = nullptr;
    std::unique_ptr<ChangeBroadcaster> broadcaster_;
    std::unique_ptr<storage::Database> database_;
    bool degraded_ = false;
    // Serializes use of the connection so a read never lands inside another
    // thread's write transaction.
    mutable std::mutex mutex_;
};

} // namespace zf::engine
