#include "TestUtils.hpp"
#include "engine/ChangeSignal.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/ProgressCodec.hpp"
#include "engine/ProgressService.hpp"
#include "engine/SyncGateway.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

using zf::engine::Calendar;
using zf::engine::ProgressService;
using zf::engine::SyncGateway;
using zf::tests::day_at;
using RecordStatus = ProgressService::RecordStatus;

namespace
{

struct WriterFixture
{
    explicit WriterFixture(std::string_view name)
        : dir(name), store(dir / "progress.db"),
          marker(dir / "progress.db.signal"),
          gateway(store, Calendar{}, &bus,
                  std::make_unique<zf::engine::MarkerFileBroadcaster>(marker)),
          service(&gateway, &bus)
    {
    }

    zf::tests::TempDir dir;
    std::filesystem::path store;
    std::filesystem::path marker;
    zf::engine::EventBus bus;
    SyncGateway gateway;
    ProgressService service;
};

} // namespace

TEST_CASE("recorded minutes accumulate")
{
    WriterFixture fx("service-total");
    for (auto minutes : {10, 15, 20})
    {
        auto result = fx.service.record_session(minutes, day_at(0));
        REQUIRE(result.status == RecordStatus::Ok);
    }
    auto state = fx.service.state();
    CHECK(state.total_minutes == 45);
    CHECK(state.total_sessions == 3);
    CHECK(state.current_streak == 1);

    SyncGateway reader(fx.store, Calendar{});
    CHECK(reader.load() == state);
    CHECK(reader.load_sessions().sessions.size() == 3);
}

TEST_CASE("non-positive durations are rejected without side effects")
{
    WriterFixture fx("service-invalid");
    REQUIRE(fx.service.record_session(30, day_at(0)).status == RecordStatus::Ok);
    zf::engine::ChangeWatcher watcher(fx.marker);

    for (auto minutes : {0, -5})
    {
        auto result = fx.service.record_session(minutes, day_at(1));
        CHECK(result.status == RecordStatus::InvalidDuration);
        CHECK(result.state.total_minutes == 30);
    }
    CHECK(fx.service.state().total_minutes == 30);
    CHECK(fx.service.state().current_streak == 1);
    CHECK(fx.gateway.load_sessions().sessions.size() == 1);
    CHECK_FALSE(watcher.poll());
}

TEST_CASE("the signal fires only after the commit is durable")
{
    WriterFixture fx("service-ordering");
    SyncGateway reader(fx.store, Calendar{});

    std::vector<std::int64_t> seen_totals;
    fx.bus.subscribe<zf::engine::ProgressChangedEvent>(
        [&](zf::engine::ProgressChangedEvent const &)
        { seen_totals.push_back(reader.load().total_minutes); });

    zf::engine::ChangeWatcher watcher(fx.marker);
    REQUIRE(fx.service.record_session(12, day_at(0)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(8, day_at(1)).status == RecordStatus::Ok);

    REQUIRE(seen_totals.size() == 2);
    CHECK(seen_totals[0] == 12);
    CHECK(seen_totals[1] == 20);
    CHECK(watcher.poll());
}

TEST_CASE("a failed commit leaves state alone and sends no signal")
{
    WriterFixture fx("service-write-failed");
    REQUIRE(fx.service.record_session(10, day_at(0)).status == RecordStatus::Ok);

    int changes = 0;
    fx.bus.subscribe<zf::engine::ProgressChangedEvent>(
        [&](zf::engine::ProgressChangedEvent const &) { ++changes; });
    zf::engine::ChangeWatcher watcher(fx.marker);

    // Another connection holding the write lock makes BEGIN IMMEDIATE fail
    // once the busy timeout expires.
    zf::storage::Database blocker(fx.store);
    REQUIRE(blocker.begin_transaction());
    auto result = fx.service.record_session(20, day_at(1));
    CHECK(blocker.rollback_transaction());

    CHECK(result.status == RecordStatus::StoreWriteFailed);
    CHECK(result.state.total_minutes == 10);
    CHECK(fx.service.state().total_minutes == 10);
    CHECK(changes == 0);
    CHECK_FALSE(watcher.poll());
    CHECK(fx.gateway.load_sessions().sessions.size() == 1);
}

TEST_CASE("session queries are newest first")
{
    WriterFixture fx("service-queries");
    REQUIRE(fx.service.record_session(10, day_at(0, 8)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(20, day_at(0, 18)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(30, day_at(1, 9)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(40, day_at(3, 9)).status == RecordStatus::Ok);

    auto all = fx.service.sessions();
    REQUIRE(all.size() == 4);
    CHECK(all.front().duration_minutes == 40);
    CHECK(all.back().duration_minutes == 10);

    auto limited = fx.service.sessions(2);
    REQUIRE(limited.size() == 2);
    CHECK(limited[0].duration_minutes == 40);
    CHECK(limited[1].duration_minutes == 30);

    auto first_day = fx.service.sessions_on_day(day_at(0, 23));
    REQUIRE(first_day.size() == 2);
    CHECK(first_day[0].duration_minutes == 20);
    CHECK(first_day[1].duration_minutes == 10);

    auto window = fx.service.sessions_between(day_at(0, 18), day_at(1, 9));
    REQUIRE(window.size() == 2);
    CHECK(window[0].duration_minutes == 30);
    CHECK(window[1].duration_minutes == 20);
}

TEST_CASE("statistics and effective streak")
{
    WriterFixture fx("service-stats");
    auto empty = fx.service.statistics(day_at(0));
    CHECK(empty.total_sessions == 0);
    CHECK(empty.average_session_minutes == 0);
    CHECK_FALSE(empty.streak_active);

    REQUIRE(fx.service.record_session(10, day_at(0)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(25, day_at(1)).status == RecordStatus::Ok);

    auto stats = fx.service.statistics(day_at(2));
    CHECK(stats.total_sessions == 2);
    CHECK(stats.total_minutes == 35);
    CHECK(stats.average_session_minutes == 17);
    CHECK(stats.current_streak == 2);
    CHECK(stats.longest_streak == 2);
    CHECK(stats.streak_active);

    CHECK(fx.service.is_streak_active(day_at(2)));
    CHECK(fx.service.effective_streak(day_at(2)) == 2);
    CHECK_FALSE(fx.service.is_streak_active(day_at(3)));
    CHECK(fx.service.effective_streak(day_at(3)) == 0);
}

TEST_CASE("state survives a restart")
{
    zf::tests::TempDir dir("service-restart");
    auto store = dir / "progress.db";
    {
        SyncGateway gateway(store, Calendar{});
        ProgressService service(&gateway);
        REQUIRE(service.record_session(45, day_at(0)).status == RecordStatus::Ok);
        REQUIRE(service.record_session(30, day_at(1)).status == RecordStatus::Ok);
    }
    SyncGateway gateway(store, Calendar{});
    ProgressService service(&gateway);
    CHECK(service.state().total_minutes == 75);
    CHECK(service.state().current_streak == 2);
    REQUIRE(service.record_session(5, day_at(2)).status == RecordStatus::Ok);
    CHECK(service.state().current_streak == 3);
}

TEST_CASE("recalculate rebuilds streaks without lowering totals")
{
    WriterFixture fx("service-recalculate");
    REQUIRE(fx.service.record_session(10, day_at(0)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(10, day_at(1)).status == RecordStatus::Ok);
    REQUIRE(fx.service.record_session(10, day_at(2)).status == RecordStatus::Ok);

    {
        zf::storage::Database raw(fx.store);
        REQUIRE(raw.set_value(zf::engine::codec::kCurrentStreakKey, "0"));
        REQUIRE(raw.set_value(zf::engine::codec::kTotalMinutesKey, "500"));
    }

    SyncGateway gateway(fx.store, Calendar{});
    ProgressService service(&gateway);
    CHECK(service.state().current_streak == 0);
    CHECK(service.state().total_minutes == 500);

    REQUIRE(service.recalculate(day_at(2)));
    auto state = service.state();
    CHECK(state.current_streak == 3);
    CHECK(state.longest_streak == 3);
    CHECK(state.total_minutes == 500);
    CHECK(state.total_sessions == 3);
    CHECK(gateway.load() == state);
}

TEST_CASE("clear history keeps statistics")
{
    WriterFixture fx("service-clear");
    REQUIRE(fx.service.record_session(60, day_at(0)).status == RecordStatus::Ok);
    zf::engine::ChangeWatcher watcher(fx.marker);

    REQUIRE(fx.service.clear_history());
    CHECK(fx.service.sessions().empty());
    CHECK(fx.service.state().total_minutes == 60);
    CHECK(watcher.poll());

    // Nothing to replay, so recalculating is a no-op.
    REQUIRE(fx.service.recalculate(day_at(1)));
    CHECK(fx.service.state().total_minutes == 60);

    REQUIRE(fx.service.record_session(15, day_at(1)).status == RecordStatus::Ok);
    CHECK(fx.service.state().total_minutes == 75);
    CHECK(fx.service.state().current_streak == 2);
}

TEST_CASE("reset wipes aggregate, history and badges")
{
    WriterFixture fx("service-reset");
    REQUIRE(fx.service.record_session(90, day_at(0)).status == RecordStatus::Ok);
    REQUIRE_FALSE(fx.service.unlocked_badges().empty());

    REQUIRE(fx.service.reset_all_data());
    CHECK(fx.service.state() == zf::engine::AggregateState{});
    CHECK(fx.service.sessions().empty());
    CHECK(fx.service.unlocked_badges().empty());

    SyncGateway reader(fx.store, Calendar{});
    CHECK(reader.load() == zf::engine::AggregateState{});
}

TEST_CASE("badges unlock once and persist")
{
    WriterFixture fx("service-badges");
    std::vector<std::string> announced;
    fx.bus.subscribe<zf::engine::BadgesUnlockedEvent>(
        [&](zf::engine::BadgesUnlockedEvent const &event)
        {
            for (auto const &unlock : event.unlocks)
            {
                announced.push_back(unlock.id);
            }
        });

    auto first = fx.service.record_session(30, day_at(0));
    CHECK(first.unlocked.empty());
    auto second = fx.service.record_session(30, day_at(0, 12));
    REQUIRE(second.unlocked.size() == 1);
    CHECK(second.unlocked[0].id == "first-hour");
    auto third = fx.service.record_session(5, day_at(0, 14));
    CHECK(third.unlocked.empty());
    CHECK(announced == std::vector<std::string>{"first-hour"});

    SyncGateway gateway(fx.store, Calendar{});
    ProgressService reloaded(&gateway);
    auto badges = reloaded.badges();
    auto first_hour = std::find_if(badges.begin(), badges.end(),
                                   [](zf::engine::BadgeStatus const &status)
                                   { return status.badge.id == "first-hour"; });
    REQUIRE(first_hour != badges.end());
    CHECK(first_hour->unlocked);
    CHECK(first_hour->progress_value == 65);
}

TEST_CASE("concurrent recordings are all counted")
{
    WriterFixture fx("service-concurrent");
    constexpr int kThreads = 4;
    constexpr int kSessionsPerThread = 25;
    constexpr std::int64_t kMinutes = 3;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [&fx, &failures, t]
            {
                for (int i = 0; i < kSessionsPerThread; ++i)
                {
                    auto result =
                        fx.service.record_session(kMinutes, day_at(0, t));
                    if (result.status != RecordStatus::Ok)
                    {
                        ++failures;
                    }
                }
            });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    constexpr std::int64_t kTotalSessions = kThreads * kSessionsPerThread;
    CHECK(failures.load() == 0);
    CHECK(fx.service.state().total_sessions == kTotalSessions);
    CHECK(fx.service.state().total_minutes == kTotalSessions * kMinutes);
    CHECK(fx.service.state().current_streak == 1);

    SyncGateway reader(fx.store, Calendar{});
    CHECK(reader.load() == fx.service.state());
    CHECK(reader.load_sessions().sessions.size() ==
          static_cast<std::size_t>(kTotalSessions));
}

TEST_CASE("change subscribers can read back through the service")
{
    WriterFixture fx("service-reentrant");
    std::vector<std::int64_t> seen_totals;
    std::size_t seen_badges = 0;
    fx.bus.subscribe<zf::engine::ProgressChangedEvent>(
        [&](zf::engine::ProgressChangedEvent const &)
        {
            seen_totals.push_back(fx.service.state().total_minutes);
            seen_badges = fx.service.badges().size();
        });

    REQUIRE(fx.service.record_session(10, day_at(0)).status == RecordStatus::Ok);
    REQUIRE(fx.service.clear_history());
    REQUIRE(fx.service.recalculate(day_at(0)));
    REQUIRE(fx.service.reset_all_data());

    // recalculate over an empty history commits nothing and sends no signal.
    CHECK((seen_totals == std::vector<std::int64_t>{10, 10, 0}));
    CHECK(seen_badges == zf::engine::Achievements::default_badges().size());
}
