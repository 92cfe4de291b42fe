#include "engine/SnapshotProvider.hpp"

#include "engine/Events.hpp"
#include "engine/SyncGateway.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace zf::engine
{

Snapshot make_snapshot(AggregateState const &state, Instant as_of,
                       StageTable const &stages)
{
    auto const resolution = stages.resolve(state.total_minutes);
    Snapshot snapshot;
    snapshot.as_of = as_of;
    snapshot.state = state;
    snapshot.stage_index = resolution.stage_index;
    snapshot.stage_name = resolution.stage_name;
    snapshot.icon_token = resolution.icon_token;
    snapshot.next_stage_threshold = resolution.next_threshold;
    snapshot.progress_fraction = resolution.progress_fraction;
    snapshot.progress_percentage =
        progress_percentage(resolution.progress_fraction);
    snapshot.minutes_until_next_stage =
        stages.minutes_until_next_stage(state.total_minutes);
    return snapshot;
}

SnapshotProvider::SnapshotProvider(SyncGateway const *gateway,
                                   StageTable stages, RefreshPolicy policy,
                                   EventBus *bus)
    : gateway_(gateway), stages_(std::move(stages)), policy_(policy), bus_(bus)
{
    if (policy_.mode == RefreshMode::Periodic &&
        policy_.interval <= std::chrono::seconds{0})
    {
        ZF_LOG_WARN("periodic refresh needs a positive interval; "
                    "refreshing on invalidation only");
        policy_ = RefreshPolicy::on_invalidation();
    }
    if (bus_ != nullptr)
    {
        subscription_ = bus_->subscribe<ProgressChangedEvent>(
            [this](ProgressChangedEvent const &) { invalidate(); });
    }
}

SnapshotProvider::~SnapshotProvider()
{
    if (bus_ != nullptr && subscription_)
    {
        bus_->unsubscribe(*subscription_);
    }
}

Snapshot SnapshotProvider::snapshot(Instant as_of) const
{
    return make_snapshot(gateway_->load(), as_of, stages_);
}

Snapshot SnapshotProvider::placeholder(Instant as_of, StageTable const &stages)
{
    AggregateState sample;
    sample.total_minutes = 150;
    sample.current_streak = 7;
    sample.longest_streak = 14;
    auto snapshot = make_snapshot(sample, as_of, stages);
    snapshot.placeholder = true;
    return snapshot;
}

void SnapshotProvider::set_watcher(std::unique_ptr<ChangeWatcher> watcher)
{
    std::lock_guard<std::mutex> lock(mutex_);
    watcher_ = std::move(watcher);
}

void SnapshotProvider::set_refresh_callback(RefreshCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void SnapshotProvider::invalidate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = RefreshState::Invalidated;
}

bool SnapshotProvider::poll(Instant now)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (watcher_ && watcher_->poll())
        {
            ZF_LOG_DEBUG("change signal observed");
            state_ = RefreshState::Invalidated;
        }
        if (policy_.mode == RefreshMode::Periodic && last_refresh_ &&
            now - *last_refresh_ >= policy_.interval)
        {
            state_ = RefreshState::Invalidated;
        }
    }
    return refresh_if_invalidated(now);
}

bool SnapshotProvider::refresh_if_invalidated(Instant now)
{
    if (state() != RefreshState::Invalidated)
    {
        return false;
    }
    refresh(now);
    return true;
}

Snapshot SnapshotProvider::refresh(Instant now)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Set before the read so an invalidate() racing with it flips the
        // state back and is not lost.
        state_ = RefreshState::Refreshed;
    }
    auto fresh = snapshot(now);
    RefreshCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = fresh;
        last_refresh_ = now;
        ++refresh_count_;
        callback = callback_;
    }
    if (callback)
    {
        callback(fresh);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // An invalidation that arrived during the read or the callback must
        // survive.
        if (state_ == RefreshState::Refreshed)
        {
            state_ = RefreshState::Idle;
        }
    }
    return fresh;
}

Snapshot SnapshotProvider::current() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_)
    {
        return *current_;
    }
    return placeholder(now_instant(), stages_);
}

RefreshState SnapshotProvider::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint64_t SnapshotProvider::refresh_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_count_;
}

} // namespace zf::engine
