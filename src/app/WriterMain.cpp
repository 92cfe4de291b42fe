#include "app/AppMain.hpp"
#include "app/JsonOutput.hpp"

#include "engine/ChangeSignal.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/ProgressCodec.hpp"
#include "engine/ProgressService.hpp"
#include "engine/Settings.hpp"
#include "engine/SyncGateway.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zf::app
{

namespace
{

constexpr char kUsage[] =
    "usage: zenflow-writer [--store=PATH] [--signal=PATH] "
    "[--utc-offset=MINUTES] <command>\n"
    "commands: record <minutes> [--at=EPOCH], stats, sessions [--limit=N], "
    "today, badges, recalculate, clear-history, reset, version";

std::optional<std::string> option_value(std::vector<std::string> const &args,
                                        std::string_view prefix)
{
    for (auto const &arg : args)
    {
        if (arg.rfind(prefix, 0) == 0)
        {
            return arg.substr(prefix.size());
        }
    }
    return std::nullopt;
}

int invalid_input(std::string_view message)
{
    log::print_status("{}", serialize_error("invalid-input", message));
    return kExitInvalidInput;
}

int run_record(engine::ProgressService &service,
               std::vector<std::string> const &args)
{
    if (args.size() < 2)
    {
        return invalid_input("record needs a duration in minutes");
    }
    auto minutes = engine::codec::decode_integer(args[1]);
    if (!minutes)
    {
        return invalid_input("duration must be an integer");
    }
    auto at = engine::now_instant();
    if (auto raw = option_value(args, "--at="))
    {
        auto epoch = engine::codec::decode_integer(*raw);
        if (!epoch)
        {
            return invalid_input("--at must be epoch seconds");
        }
        at = engine::from_epoch_seconds(*epoch);
    }

    auto result = service.record_session(*minutes, at);
    log::print_status("{}", serialize_record_result(result));
    switch (result.status)
    {
    case engine::ProgressService::RecordStatus::Ok:
        return kExitOk;
    case engine::ProgressService::RecordStatus::InvalidDuration:
        return kExitInvalidInput;
    case engine::ProgressService::RecordStatus::StoreWriteFailed:
        return kExitFailure;
    }
    return kExitFailure;
}

int run_sessions(engine::ProgressService &service,
                 std::vector<std::string> const &args)
{
    std::optional<std::size_t> limit;
    if (auto raw = option_value(args, "--limit="))
    {
        auto parsed = engine::codec::decode_integer(*raw);
        if (!parsed || *parsed < 0)
        {
            return invalid_input("--limit must be a non-negative integer");
        }
        limit = static_cast<std::size_t>(*parsed);
    }
    log::print_status("{}", serialize_sessions(service.sessions(limit)));
    return kExitOk;
}

int action_result(std::string_view action, bool ok, bool degraded)
{
    if (!ok)
    {
        log::print_status("{}", serialize_error("store-write-failed", action));
        return kExitFailure;
    }
    log::print_status("{}", serialize_action(action, degraded));
    return kExitOk;
}

} // namespace

int writer_main(int argc, char *argv[])
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
        if (command == "version")
        {
            log::print_status("{}", version::kWriterDisplayVersion);
            return kExitOk;
        }

        engine::EventBus bus;
        bus.subscribe<engine::StoreDegradedEvent>(
            [](engine::StoreDegradedEvent const &event)
            {
                ZF_LOG_WARN("writing to a private store; {} is unavailable ({})",
                            event.path.string(), event.reason);
            });
        engine::SyncGateway gateway(
            settings.store_path, settings.calendar(), &bus,
            std::make_unique<engine::MarkerFileBroadcaster>(
                settings.signal_path));
        engine::ProgressService service(&gateway, &bus);
        auto const now = engine::now_instant();

        if (command == "record")
        {
            return run_record(service, rest);
        }
        if (command == "stats")
        {
            log::print_status("{}",
                              serialize_statistics(service.statistics(now),
                                                   service.effective_streak(now)));
            return kExitOk;
        }
        if (command == "sessions")
        {
            return run_sessions(service, rest);
        }
        if (command == "today")
        {
            log::print_status("{}",
                              serialize_sessions(service.sessions_on_day(now)));
            return kExitOk;
        }
        if (command == "badges")
        {
            log::print_status("{}", serialize_badges(service.badges()));
            return kExitOk;
        }
        if (command == "recalculate")
        {
            return action_result("recalculate", service.recalculate(now),
                                 gateway.is_degraded());
        }
        if (command == "clear-history")
        {
            return action_result("clear-history", service.clear_history(),
                                 gateway.is_degraded());
        }
        if (command == "reset")
        {
            return action_result("reset", service.reset_all_data(),
                                 gateway.is_degraded());
        }

        log::print_status("{}", kUsage);
        return invalid_input("unknown command");
    }
    catch (std::exception const &ex)
    {
        ZF_LOG_ERROR("zenflow-writer failed: {}", ex.what());
        std::fprintf(stderr, "zenflow-writer failed: %s\n", ex.what());
    }
    return kExitFailure;
}

} // namespace zf::app
