#include "TestUtils.hpp"
#include "engine/ChangeSignal.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/ProgressCodec.hpp"
#include "engine/ProgressService.hpp"
#include "engine/SnapshotProvider.hpp"
#include "engine/SyncGateway.hpp"
#include "utils/StateStore.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <doctest/doctest.h>

using zf::engine::Calendar;
using zf::engine::RefreshPolicy;
using zf::engine::RefreshState;
using zf::engine::SnapshotProvider;
using zf::engine::StageTable;
using zf::engine::SyncGateway;
using zf::tests::day_at;

TEST_CASE("placeholder carries sample data")
{
    auto snapshot = SnapshotProvider::placeholder(day_at(0),
                                                  StageTable::tree_growth());
    CHECK(snapshot.placeholder);
    CHECK(snapshot.state.total_minutes == 150);
    CHECK(snapshot.state.current_streak == 7);
    CHECK(snapshot.state.longest_streak == 14);
    CHECK(snapshot.stage_name == "Sapling");
    CHECK(snapshot.progress_fraction == doctest::Approx(30.0 / 180.0));
    CHECK(snapshot.progress_percentage == 16);
    CHECK(snapshot.minutes_until_next_stage == 150);
}

TEST_CASE("provider starts invalidated and shows the placeholder")
{
    zf::tests::TempDir dir("provider-initial");
    SyncGateway gateway(dir / "progress.db", Calendar{});
    SnapshotProvider provider(&gateway, StageTable::tree_growth());

    CHECK(provider.state() == RefreshState::Invalidated);
    CHECK(provider.current().placeholder);
    CHECK(provider.refresh_count() == 0);

    CHECK(provider.poll(day_at(0)));
    CHECK(provider.state() == RefreshState::Idle);
    CHECK_FALSE(provider.current().placeholder);
    CHECK(provider.current().state.total_minutes == 0);
    CHECK(provider.current().stage_name == "Seed");
    CHECK_FALSE(provider.poll(day_at(0)));
    CHECK(provider.refresh_count() == 1);
}

TEST_CASE("refresh state machine follows invalidations")
{
    zf::tests::TempDir dir("provider-machine");
    zf::engine::EventBus bus;
    SyncGateway gateway(dir / "progress.db", Calendar{}, &bus);
    zf::engine::ProgressService service(&gateway, &bus);
    SnapshotProvider provider(&gateway, StageTable::tree_growth(),
                              RefreshPolicy::on_invalidation(), &bus);

    provider.refresh(day_at(0));
    CHECK(provider.state() == RefreshState::Idle);

    RefreshState during_callback = RefreshState::Idle;
    provider.set_refresh_callback([&](zf::engine::Snapshot const &)
                                  { during_callback = provider.state(); });

    REQUIRE(service.record_session(40, day_at(0)).status ==
            zf::engine::ProgressService::RecordStatus::Ok);
    CHECK(provider.state() == RefreshState::Invalidated);
    // Reads in between do not touch the refresh state.
    CHECK(provider.snapshot(day_at(0)).state.total_minutes == 40);
    CHECK(provider.current().state.total_minutes == 0);

    CHECK(provider.refresh_if_invalidated(day_at(0)));
    CHECK(during_callback == RefreshState::Refreshed);
    CHECK(provider.state() == RefreshState::Idle);
    CHECK(provider.current().state.total_minutes == 40);
    CHECK(provider.current().stage_name == "Sprout");
    CHECK_FALSE(provider.refresh_if_invalidated(day_at(0)));
}

TEST_CASE("cross-process signal wakes the reader")
{
    zf::tests::TempDir dir("provider-cross");
    auto store = dir / "progress.db";
    auto marker = dir / "progress.db.signal";

    SyncGateway writer_gateway(
        store, Calendar{}, nullptr,
        std::make_unique<zf::engine::MarkerFileBroadcaster>(marker));
    zf::engine::ProgressService writer(&writer_gateway);

    SyncGateway reader_gateway(store, Calendar{});
    SnapshotProvider provider(&reader_gateway, StageTable::tree_growth());
    provider.set_watcher(std::make_unique<zf::engine::ChangeWatcher>(marker));
    CHECK(provider.poll(day_at(0)));
    CHECK_FALSE(provider.poll(day_at(0)));

    REQUIRE(writer.record_session(25, day_at(0)).status ==
            zf::engine::ProgressService::RecordStatus::Ok);
    REQUIRE(writer.record_session(10, day_at(0)).status ==
            zf::engine::ProgressService::RecordStatus::Ok);

    CHECK(provider.poll(day_at(0)));
    CHECK(provider.current().state.total_minutes == 35);
    CHECK(provider.current().stage_index == 1);
    CHECK(provider.refresh_count() == 2);
    CHECK_FALSE(provider.poll(day_at(0)));
}

TEST_CASE("periodic policy refreshes after the interval")
{
    zf::tests::TempDir dir("provider-periodic");
    SyncGateway gateway(dir / "progress.db", Calendar{});
    SnapshotProvider provider(&gateway, StageTable::tree_growth(),
                              RefreshPolicy::periodic(std::chrono::seconds{60}));

    auto start = day_at(0);
    CHECK(provider.poll(start));
    CHECK_FALSE(provider.poll(start + std::chrono::seconds{30}));
    CHECK(provider.poll(start + std::chrono::seconds{60}));
    CHECK(provider.refresh_count() == 2);
}

TEST_CASE("periodic policy without an interval falls back")
{
    zf::tests::TempDir dir("provider-periodic-zero");
    SyncGateway gateway(dir / "progress.db", Calendar{});
    SnapshotProvider provider(&gateway, StageTable::tree_growth(),
                              RefreshPolicy::periodic(std::chrono::seconds{0}));
    CHECK(provider.policy().mode == zf::engine::RefreshMode::OnInvalidation);
}

TEST_CASE("snapshot sums only decodable sessions")
{
    zf::tests::TempDir dir("provider-corrupt");
    auto store = dir / "progress.db";
    {
        zf::storage::Database raw(store);
        REQUIRE(raw.is_valid());
        namespace codec = zf::engine::codec;
        REQUIRE(raw.append_session(codec::encode_session({day_at(0), 20})));
        REQUIRE(raw.append_session(R"({"date":12,"durationMinutes":"ten"})"));
        REQUIRE(raw.append_session(codec::encode_session({day_at(1), 15})));
        REQUIRE(raw.append_session("[]"));
    }

    SyncGateway gateway(store, Calendar{});
    SnapshotProvider provider(&gateway, StageTable::tree_growth());
    auto snapshot = provider.snapshot(day_at(1));
    CHECK(snapshot.state.total_minutes == 35);
    CHECK(snapshot.state.current_streak == 2);
    CHECK(snapshot.stage_name == "Sprout");
    CHECK_FALSE(snapshot.placeholder);
}

TEST_CASE("destroyed provider stops listening to the bus")
{
    zf::tests::TempDir dir("provider-unsubscribe");
    zf::engine::EventBus bus;
    SyncGateway gateway(dir / "progress.db", Calendar{}, &bus);
    {
        SnapshotProvider provider(&gateway, StageTable::tree_growth(),
                                  RefreshPolicy{}, &bus);
    }
    bus.publish(zf::engine::ProgressChangedEvent{});
    CHECK(gateway.load().total_minutes == 0);
}

TEST_CASE("an invalidation during refresh schedules another refresh")
{
    zf::tests::TempDir dir("provider-reinvalidate");
    SyncGateway gateway(dir / "progress.db", Calendar{});
    SnapshotProvider provider(&gateway, StageTable::tree_growth());

    bool first = true;
    provider.set_refresh_callback(
        [&](zf::engine::Snapshot const &)
        {
            if (first)
            {
                first = false;
                provider.invalidate();
            }
        });

    provider.refresh(day_at(0));
    CHECK(provider.state() == RefreshState::Invalidated);
    CHECK(provider.refresh_if_invalidated(day_at(0)));
    CHECK(provider.state() == RefreshState::Idle);
    CHECK(provider.refresh_count() == 2);
}

TEST_CASE("refreshes racing with a writer settle on the latest state")
{
    zf::tests::TempDir dir("provider-race");
    zf::engine::EventBus bus;
    SyncGateway gateway(dir / "progress.db", Calendar{}, &bus);
    zf::engine::ProgressService service(&gateway, &bus);
    SnapshotProvider provider(&gateway, StageTable::tree_growth(),
                              RefreshPolicy::on_invalidation(), &bus);

    constexpr int kSessions = 200;
    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::thread writer(
        [&]
        {
            for (int i = 0; i < kSessions; ++i)
            {
                if (service.record_session(1, day_at(0)).status !=
                    zf::engine::ProgressService::RecordStatus::Ok)
                {
                    ++failures;
                }
            }
            done = true;
        });
    while (!done.load())
    {
        provider.refresh_if_invalidated(day_at(0));
    }
    writer.join();
    provider.refresh_if_invalidated(day_at(0));

    CHECK(failures.load() == 0);
    CHECK(provider.state() == RefreshState::Idle);
    CHECK(provider.current().state.total_minutes == kSessions);
}
