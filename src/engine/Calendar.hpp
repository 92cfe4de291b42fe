#pragma once

#include "engine/Progress.hpp"

#include <chrono>
#include <cstdint>

namespace zf::engine
{

// Maps instants onto calendar days using a fixed offset from UTC. Streaks are
// counted in these days, never in elapsed hours.
class Calendar
{
  public:
    explicit Calendar(std::chrono::minutes utc_offset = std::chrono::minutes{0});

    // Offset of the host's local time zone at the current moment.
    static Calendar local();

    std::chrono::minutes utc_offset() const noexcept { return utc_offset_; }

    std::int64_t day_number(Instant instant) const noexcept;
    // day_number(to) - day_number(from); negative when `to` is on an earlier
    // day.
    std::int64_t days_between(Instant from, Instant to) const noexcept;
    bool same_day(Instant lhs, Instant rhs) const noexcept;
    Instant start_of_day(Instant instant) const noexcept;

  private:
    std::chrono::minutes utc_offset_;
};

} // namespace zf::engine
