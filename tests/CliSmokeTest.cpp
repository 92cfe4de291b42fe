#include "TestUtils.hpp"
#include "app/AppMain.hpp"
#include "engine/ChangeSignal.hpp"
#include "engine/SyncGateway.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using zf::engine::Calendar;
using zf::engine::SyncGateway;

namespace
{

using Entry = int (*)(int, char *[]);

// Runs an entry point against an isolated store with UTC day boundaries.
int run(Entry entry, zf::tests::TempDir const &dir,
        std::vector<std::string> args)
{
    std::vector<std::string> full = {
        "zenflow",
        "--store=" + (dir / "progress.db").string(),
        "--utc-offset=0",
    };
    full.insert(full.end(), args.begin(), args.end());

    std::vector<char *> argv;
    for (auto &arg : full)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return entry(static_cast<int>(full.size()), argv.data());
}

} // namespace

TEST_CASE("writer records sessions into the shared store")
{
    zf::tests::TempDir dir("cli-record");
    zf::engine::ChangeWatcher watcher(dir / "progress.db.signal");

    CHECK(run(zf::app::writer_main, dir, {"record", "25", "--at=1704103200"}) ==
          zf::app::kExitOk);
    CHECK(run(zf::app::writer_main, dir, {"record", "20", "--at=1704189600"}) ==
          zf::app::kExitOk);
    CHECK(watcher.poll());

    SyncGateway gateway(dir / "progress.db", Calendar{});
    auto state = gateway.load();
    CHECK(state.total_minutes == 45);
    CHECK(state.total_sessions == 2);
    CHECK(state.current_streak == 2);
    CHECK(gateway.load_sessions().sessions.size() == 2);
}

TEST_CASE("writer rejects bad input")
{
    zf::tests::TempDir dir("cli-invalid");
    CHECK(run(zf::app::writer_main, dir, {}) == zf::app::kExitInvalidInput);
    CHECK(run(zf::app::writer_main, dir, {"meditate"}) ==
          zf::app::kExitInvalidInput);
    CHECK(run(zf::app::writer_main, dir, {"record"}) ==
          zf::app::kExitInvalidInput);
    CHECK(run(zf::app::writer_main, dir, {"record", "abc"}) ==
          zf::app::kExitInvalidInput);
    CHECK(run(zf::app::writer_main, dir, {"record", "-5"}) ==
          zf::app::kExitInvalidInput);
    CHECK(run(zf::app::writer_main, dir, {"record", "10", "--at=noon"}) ==
          zf::app::kExitInvalidInput);
    CHECK(run(zf::app::writer_main, dir, {"sessions", "--limit=-1"}) ==
          zf::app::kExitInvalidInput);

    SyncGateway gateway(dir / "progress.db", Calendar{});
    CHECK(gateway.load().total_minutes == 0);
    CHECK(gateway.load_sessions().sessions.empty());
}

TEST_CASE("writer queries and maintenance commands")
{
    zf::tests::TempDir dir("cli-maintenance");
    REQUIRE(run(zf::app::writer_main, dir, {"record", "30"}) ==
            zf::app::kExitOk);

    for (auto const *command :
         {"stats", "today", "badges", "recalculate", "version"})
    {
        CAPTURE(command);
        CHECK(run(zf::app::writer_main, dir, {command}) == zf::app::kExitOk);
    }
    CHECK(run(zf::app::writer_main, dir, {"sessions", "--limit=1"}) ==
          zf::app::kExitOk);

    CHECK(run(zf::app::writer_main, dir, {"clear-history"}) ==
          zf::app::kExitOk);
    {
        SyncGateway gateway(dir / "progress.db", Calendar{});
        CHECK(gateway.load_sessions().sessions.empty());
        CHECK(gateway.load().total_minutes == 30);
    }

    CHECK(run(zf::app::writer_main, dir, {"reset"}) == zf::app::kExitOk);
    SyncGateway gateway(dir / "progress.db", Calendar{});
    CHECK(gateway.load() == zf::engine::AggregateState{});
}

TEST_CASE("widget reads progress without recording or signalling")
{
    zf::tests::TempDir dir("cli-widget");
    REQUIRE(run(zf::app::writer_main, dir, {"record", "40"}) ==
            zf::app::kExitOk);
    auto const marker = dir / "progress.db.signal";
    REQUIRE(std::filesystem::exists(marker));
    auto const token = zf::engine::read_marker_token(marker);
    REQUIRE(token);

    CHECK(run(zf::app::widget_main, dir, {"snapshot"}) == zf::app::kExitOk);
    CHECK(run(zf::app::widget_main, dir, {"placeholder"}) == zf::app::kExitOk);
    CHECK(run(zf::app::widget_main, dir, {"version"}) == zf::app::kExitOk);
    CHECK(run(zf::app::widget_main, dir, {}) == zf::app::kExitInvalidInput);
    CHECK(run(zf::app::widget_main, dir, {"render"}) ==
          zf::app::kExitInvalidInput);

    CHECK(zf::engine::read_marker_token(marker) == token);
    SyncGateway gateway(dir / "progress.db", Calendar{});
    CHECK(gateway.load().total_minutes == 40);
    CHECK(gateway.load_sessions().sessions.size() == 1);
}

TEST_CASE("widget on a fresh path shows empty progress")
{
    zf::tests::TempDir dir("cli-widget-fresh");
    CHECK(run(zf::app::widget_main, dir, {"snapshot"}) == zf::app::kExitOk);

    // The reader may create an empty store but never records or signals.
    CHECK_FALSE(std::filesystem::exists(dir / "progress.db.signal"));
    SyncGateway gateway(dir / "progress.db", Calendar{});
    CHECK(gateway.load() == zf::engine::AggregateState{});
    CHECK(gateway.load_sessions().sessions.empty());
}
