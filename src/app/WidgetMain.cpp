#include "app/AppMain.hpp"
#include "app/JsonOutput.hpp"

#include "engine/ChangeSignal.hpp"
#include "engine/MilestoneResolver.hpp"
#include "engine/Settings.hpp"
#include "engine/SnapshotProvider.hpp"
#include "engine/SyncGateway.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace zf::app
{

namespace
{

constexpr char kUsage[] =
    "usage: zenflow-widget [--store=PATH] [--signal=PATH] "
    "[--utc-offset=MINUTES] [--refresh-interval=SECONDS] <command>\n"
    "commands: snapshot, placeholder, watch [--poll-ms=N], version";

int run_watch(engine::SnapshotProvider &provider,
              engine::EngineSettings const &settings)
{
    runtime::install_signal_handlers();
    provider.set_watcher(
        std::make_unique<engine::ChangeWatcher>(settings.signal_path));
    provider.set_refresh_callback(
        [](engine::Snapshot const &snapshot)
        { log::print_status("{}", serialize_snapshot(snapshot)); });

    ZF_LOG_INFO("watching {} every {} ms", settings.signal_path.string(),
                settings.watch_poll_interval.count());
    provider.refresh(engine::now_instant());
    while (!runtime::should_shutdown())
    {
        std::this_thread::sleep_for(settings.watch_poll_interval);
        provider.poll(engine::now_instant());
    }
    ZF_LOG_INFO("watch stopped after {} refreshes", provider.refresh_count());
    return kExitOk;
}

} // namespace

int widget_main(int argc, char *argv[])
{
    try
    {
        std::vector<std::string> args;
        for (int index = 1; index < argc; ++index)
        {
            if (argv[index] != nullptr)
            {
                args.emplace_back(argv[index]);
            }
        }

        std::vector<std::string> rest;
        auto settings = engine::SettingsLoader::load(
            engine::SettingsLoader::process_environment(), args, &rest);
        if (rest.empty())
        {
            log::print_status("{}", kUsage);
            return kExitInvalidInput;
        }

        auto const &command = rest.front();
        auto const &stages = engine::StageTable::tree_growth();
        if (command == "version")
        {
            log::print_status("{}", version::kWidgetDisplayVersion);
            return kExitOk;
        }
        if (command == "placeholder")
        {
            log::print_status("{}", serialize_snapshot(
                                        engine::SnapshotProvider::placeholder(
                                            engine::now_instant(), stages)));
            return kExitOk;
        }
        if (command != "snapshot" && command != "watch")
        {
            log::print_status("{}", kUsage);
            log::print_status(
                "{}", serialize_error("invalid-input", "unknown command"));
            return kExitInvalidInput;
        }

        // The widget never commits or signals; it only reads the gateway.
        engine::SyncGateway gateway(settings.store_path, settings.calendar());
        if (gateway.is_degraded())
        {
            ZF_LOG_WARN("shared store unavailable; rendering empty progress");
        }
        engine::SnapshotProvider provider(&gateway, stages, settings.refresh);

        if (command == "snapshot")
        {
            log::print_status(
                "{}", serialize_snapshot(provider.refresh(engine::now_instant())));
            return kExitOk;
        }
        return run_watch(provider, settings);
    }
    catch (std::exception const &ex)
    {
        ZF_LOG_ERROR("zenflow-widget failed: {}", ex.what());
        std::fprintf(stderr, "zenflow-widget failed: %s\n", ex.what());
    }
    return kExitFailure;
}

} // namespace zf::app
