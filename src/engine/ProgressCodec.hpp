#pragma once

#include "engine/Achievements.hpp"
#include "engine/Progress.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zf::engine::codec
{

// Keys of the `progress` table.
inline constexpr char kTotalMinutesKey[] = "zenflow_total_minutes";
inline constexpr char kCurrentStreakKey[] = "zenflow_current_streak";
inline constexpr char kLongestStreakKey[] = "zenflow_longest_streak";
inline constexpr char kLastSessionDateKey[] = "zenflow_last_session_date";
inline constexpr char kTotalSessionsKey[] = "zenflow_total_sessions";
inline constexpr char kBadgesKey[] = "zenflow_badges";

// {"date": <epoch seconds>, "durationMinutes": <int>}
std::string encode_session(Session const &session);
// nullopt for anything that is not an object with two integer fields and a
// non-negative duration.
std::optional<Session> decode_session(std::string_view payload);

std::string encode_badge_unlocks(std::vector<BadgeUnlock> const &unlocks);
// Entries without a string id or integer unlockedAt are dropped, as are
// repeated ids.
std::optional<std::vector<BadgeUnlock>>
decode_badge_unlocks(std::string_view payload);

std::string encode_integer(std::int64_t value);
// Whole string must be a base-10 integer.
std::optional<std::int64_t> decode_integer(std::string_view text);

} // namespace zf::engine::codec
