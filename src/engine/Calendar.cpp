#include "engine/Calendar.hpp"

#include <ctime>

namespace zf::engine
{

namespace
{

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t floor_div(std::int64_t value, std::int64_t divisor)
{
    auto quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

} // namespace

Calendar::Calendar(std::chrono::minutes utc_offset) : utc_offset_(utc_offset)
{
}

Calendar Calendar::local()
{
    auto const now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
    long offset_seconds = 0;
    _get_timezone(&offset_seconds);
    offset_seconds = -offset_seconds + (tm.tm_isdst > 0 ? 3600 : 0);
#else
    localtime_r(&now, &tm);
    long offset_seconds = tm.tm_gmtoff;
#endif
    return Calendar(std::chrono::minutes{offset_seconds / 60});
}

std::int64_t Calendar::day_number(Instant instant) const noexcept
{
    auto local_seconds =
        to_epoch_seconds(instant) +
        static_cast<std::int64_t>(utc_offset_.count()) * 60;
    return floor_div(local_seconds, kSecondsPerDay);
}

std::int64_t Calendar::days_between(Instant from, Instant to) const noexcept
{
    return day_number(to) - day_number(from);
}

bool Calendar::same_day(Instant lhs, Instant rhs) const noexcept
{
    return day_number(lhs) == day_number(rhs);
}

Instant Calendar::start_of_day(Instant instant) const noexcept
{
    auto start = day_number(instant) * kSecondsPerDay -
                 static_cast<std::int64_t>(utc_offset_.count()) * 60;
    return from_epoch_seconds(start);
}

} // namespace zf::engine
