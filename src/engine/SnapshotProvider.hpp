#pragma once

#include "engine/ChangeSignal.hpp"
#include "engine/EventBus.hpp"
#include "engine/MilestoneResolver.hpp"
#include "engine/Progress.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace zf::engine
{
class SyncGateway;

enum class RefreshState
{
    Idle,
    Invalidated,
    Refreshed
};

enum class RefreshMode
{
    // Refresh only after an observed invalidation.
    OnInvalidation,
    // Also invalidate once `interval` has passed since the last refresh.
    Periodic
};

struct RefreshPolicy
{
    RefreshMode mode = RefreshMode::OnInvalidation;
    std::chrono::seconds interval{0};

    static RefreshPolicy on_invalidation() { return {}; }
    static RefreshPolicy periodic(std::chrono::seconds every)
    {
        return {RefreshMode::Periodic, every};
    }
};

Snapshot make_snapshot(AggregateState const &state, Instant as_of,
                       StageTable const &stages);

// Reader-side, pull-based view of the shared progress. Never writes to the
// gateway.
class SnapshotProvider
{
  public:
    using RefreshCallback = std::function<void(Snapshot const &)>;

    // Starts Invalidated so the first poll produces a real snapshot.
    SnapshotProvider(SyncGateway const *gateway, StageTable stages,
                     RefreshPolicy policy = {}, EventBus *bus = nullptr);
    ~SnapshotProvider();

    SnapshotProvider(SnapshotProvider const &) = delete;
    SnapshotProvider &operator=(SnapshotProvider const &) = delete;

    // Fresh read of the gateway. Does not touch the refresh state.
    Snapshot snapshot(Instant as_of) const;
    // Sample data for first render: 150 minutes, streak 7, longest 14.
    static Snapshot placeholder(Instant as_of, StageTable const &stages);

    void set_watcher(std::unique_ptr<ChangeWatcher> watcher);
    void set_refresh_callback(RefreshCallback callback);

    void invalidate();
    // Checks the watcher and the periodic deadline, then refreshes if
    // invalidated. Returns true when a refresh happened.
    bool poll(Instant now);
    bool refresh_if_invalidated(Instant now);
    Snapshot refresh(Instant now);

    // Last refreshed snapshot, or the placeholder before the first refresh.
    Snapshot current() const;
    RefreshState state() const;
    std::uint64_t refresh_count() const;
    RefreshPolicy const &policy() const noexcept { return policy_; }

  private:
    SyncGateway const *gateway_;
    StageTable stages_;
    RefreshPolicy policy_;
    EventBus *bus_;
    std::optional<EventBus::SubscriptionId> subscription_;
    std::unique_ptr<ChangeWatcher> watcher_;
    RefreshCallback callback_;

    mutable std::mutex mutex_;
    RefreshState state_ = RefreshState::Invalidated;
    std::optional<Snapshot> current_;
    std::optional<Instant> last_refresh_;
    std::uint64_t refresh_count_ = 0;
};

} // namespace zf::engine
