#pragma once

#include "engine/Calendar.hpp"
#include "engine/SnapshotProvider.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace zf::engine
{

struct EngineSettings
{
    std::filesystem::path store_path;
    // Empty until resolved; defaults to "<store_path>.signal".
    std::filesystem::path signal_path;
    std::chrono::minutes utc_offset{0};
    RefreshPolicy refresh;
    std::chrono::milliseconds watch_poll_interval{500};

    Calendar calendar() const { return Calendar(utc_offset); }
};

// Defaults, then environment, then command line. Malformed values are logged
// and ignored so a typo never stops the process.
class SettingsLoader
{
  public:
    using EnvReader =
        std::function<std::optional<std::string>(char const *key)>;

    static EnvReader process_environment();

    static EngineSettings defaults(EnvReader const &env);
    static void apply_environment(EngineSettings &settings,
                                  EnvReader const &env);
    // Consumes --store=, --signal=, --utc-offset=, --refresh-interval= and
    // --poll-ms=; everything else is returned in order.
    static std::vector<std::string>
    apply_arguments(EngineSettings &settings,
                    std::vector<std::string> const &args);

    static EngineSettings load(EnvReader const &env,
                               std::vector<std::string> const &args,
                               std::vector<std::string> *remaining = nullptr);
};

} // namespace zf::engine
