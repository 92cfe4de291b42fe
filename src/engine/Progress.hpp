#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zf::engine
{

// Every persisted instant has whole-second precision.
using Instant = std::chrono::sys_seconds;

inline Instant now_instant()
{
    return std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
}

inline std::int64_t to_epoch_seconds(Instant instant)
{
    return static_cast<std::int64_t>(instant.time_since_epoch().count());
}

inline Instant from_epoch_seconds(std::int64_t seconds)
{
    return Instant{std::chrono::seconds{seconds}};
}

struct Session
{
    Instant timestamp{};
    std::int64_t duration_minutes = 0;

    bool operator==(Session const &) const = default;
};

struct AggregateState
{
    std::int64_t total_minutes = 0;
    int current_streak = 0;
    int longest_streak = 0;
    std::optional<Instant> last_session_date;
    std::int64_t total_sessions = 0;

    bool operator==(AggregateState const &) const = default;
};

// Result of decoding the event store; corrupt rows are counted, not fatal.
struct SessionLoad
{
    std::vector<Session> sessions;
    std::size_t skipped = 0;
};

struct ProgressStatistics
{
    std::int64_t total_sessions = 0;
    std::int64_t total_minutes = 0;
    std::int64_t average_session_minutes = 0;
    int current_streak = 0;
    int longest_streak = 0;
    bool streak_active = false;
    std::optional<Instant> last_session_date;
};

struct Snapshot
{
    Instant as_of{};
    AggregateState state;
    std::size_t stage_index = 0;
    std::string stage_name;
    std::string icon_token;
    std::optional<std::int64_t> next_stage_threshold;
    double progress_fraction = 0.0;
    int progress_percentage = 0;
    std::optional<std::int64_t> minutes_until_next_stage;
    // Set only on bootstrap snapshots that carry sample data.
    bool placeholder = false;
};

} // namespace zf::engine
