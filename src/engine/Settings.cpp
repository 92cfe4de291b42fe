#include "engine/Settings.hpp"

#include "engine/ProgressCodec.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cstdlib>
#include <string_view>
#include <utility>

namespace zf::engine
{

namespace
{

constexpr char kStoreFileName[] = "progress.db";
constexpr std::int64_t kMaxUtcOffsetMinutes = 18 * 60;

bool parse_utc_offset(EngineSettings &settings, std::string_view source,
                      std::string const &raw)
{
    auto value = codec::decode_integer(raw);
    if (!value || *value < -kMaxUtcOffsetMinutes ||
        *value > kMaxUtcOffsetMinutes)
    {
        ZF_LOG_WARN("ignoring invalid UTC offset '{}' from {}", raw, source);
        return false;
    }
    settings.utc_offset = std::chrono::minutes{*value};
    return true;
}

bool parse_refresh_interval(EngineSettings &settings, std::string_view source,
                            std::string const &raw)
{
    auto value = codec::decode_integer(raw);
    if (!value || *value < 0)
    {
        ZF_LOG_WARN("ignoring invalid refresh interval '{}' from {}", raw,
                    source);
        return false;
    }
    settings.refresh =
        *value == 0
            ? RefreshPolicy::on_invalidation()
            : RefreshPolicy::periodic(std::chrono::seconds{*value});
    return true;
}

bool parse_poll_interval(EngineSettings &settings, std::string const &raw)
{
    auto value = codec::decode_integer(raw);
    if (!value || *value <= 0)
    {
        ZF_LOG_WARN("ignoring invalid poll interval '{}'", raw);
        return false;
    }
    settings.watch_poll_interval = std::chrono::milliseconds{*value};
    return true;
}

bool parse_path(std::filesystem::path &target, std::string_view name,
                std::string const &raw)
{
    if (raw.empty())
    {
        ZF_LOG_WARN("ignoring empty {}", name);
        return false;
    }
    target = std::filesystem::path(raw);
    return true;
}

} // namespace

SettingsLoader::EnvReader SettingsLoader::process_environment()
{
    return [](char const *key) -> std::optional<std::string>
    {
        auto value = std::getenv(key);
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
    };
}

EngineSettings SettingsLoader::defaults(EnvReader const &env)
{
    EngineSettings settings;
    if (auto group = env("ZF_APP_GROUP_DIR"); group && !group->empty())
    {
        settings.store_path = std::filesystem::path(*group) / kStoreFileName;
    }
    else if (auto root = utils::app_group_root())
    {
        settings.store_path = *root / kStoreFileName;
    }
    else
    {
        settings.store_path = utils::data_root() / kStoreFileName;
    }
    settings.utc_offset = Calendar::local().utc_offset();
    return settings;
}

void SettingsLoader::apply_environment(EngineSettings &settings,
                                       EnvReader const &env)
{
    if (auto value = env("ZF_STORE_PATH"))
    {
        parse_path(settings.store_path, "ZF_STORE_PATH", *value);
    }
    if (auto value = env("ZF_SIGNAL_PATH"))
    {
        parse_path(settings.signal_path, "ZF_SIGNAL_PATH", *value);
    }
    if (auto value = env("ZF_UTC_OFFSET_MINUTES"))
    {
        parse_utc_offset(settings, "ZF_UTC_OFFSET_MINUTES", *value);
    }
    if (auto value = env("ZF_REFRESH_INTERVAL_SECONDS"))
    {
        parse_refresh_interval(settings, "ZF_REFRESH_INTERVAL_SECONDS",
                               *value);
    }
}

std::vector<std::string>
SettingsLoader::apply_arguments(EngineSettings &settings,
                                std::vector<std::string> const &args)
{
    std::vector<std::string> remaining;
    for (auto const &arg : args)
    {
        auto value_of = [&arg](std::string_view prefix)
            -> std::optional<std::string>
        {
            if (arg.rfind(prefix, 0) != 0)
            {
                return std::nullopt;
            }
            return arg.substr(prefix.size());
        };

        if (auto store = value_of("--store="))
        {
            parse_path(settings.store_path, "--store", *store);
        }
        else if (auto marker = value_of("--signal="))
        {
            parse_path(settings.signal_path, "--signal", *marker);
        }
        else if (auto offset = value_of("--utc-offset="))
        {
            parse_utc_offset(settings, "--utc-offset", *offset);
        }
        else if (auto interval = value_of("--refresh-interval="))
        {
            parse_refresh_interval(settings, "--refresh-interval", *interval);
        }
        else if (auto poll = value_of("--poll-ms="))
        {
            parse_poll_interval(settings, *poll);
        }
        else
        {
            remaining.push_back(arg);
        }
    }
    return remaining;
}

EngineSettings SettingsLoader::load(EnvReader const &env,
                                    std::vector<std::string> const &args,
                                    std::vector<std::string> *remaining)
{
    auto settings = defaults(env);
    apply_environment(settings, env);
    auto rest = apply_arguments(settings, args);
    if (settings.signal_path.empty())
    {
        settings.signal_path = settings.store_path;
        settings.signal_path += ".signal";
    }
    if (remaining != nullptr)
    {
        *remaining = std::move(rest);
    }
    ZF_LOG_DEBUG("store {} signal {} utc offset {} min",
                 settings.store_path.string(), settings.signal_path.string(),
                 settings.utc_offset.count());
    return settings;
}

} // namespace zf::engine
