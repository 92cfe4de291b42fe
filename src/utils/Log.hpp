#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace zf::log
{

// Defined in Log.cpp; appends one finished line to zenflow.log.
void append_log_line_to_file(std::string const &line);

// ZF_ENABLE_LOGGING=1 wins over ZF_BUILD_MINIMAL so a release build can be
// made to log for diagnostics.
#if (defined(ZF_ENABLE_LOGGING) && (ZF_ENABLE_LOGGING)) ||                     \
    !defined(ZF_BUILD_MINIMAL)
#define ZF_LOGGING_ACTIVE 1
#else
#define ZF_LOGGING_ACTIVE 0
#endif

#if ZF_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    auto const now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    append_log_line_to_file(final);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

// User-facing output; never disabled and never written to the log file.
template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace zf::log

#if ZF_LOGGING_ACTIVE
#define ZF_LOG_INFO(fmt, ...) zf::log::write_line('I', fmt, ##__VA_ARGS__)
#define ZF_LOG_DEBUG(fmt, ...) zf::log::write_line('D', fmt, ##__VA_ARGS__)
#define ZF_LOG_WARN(fmt, ...) zf::log::write_line('W', fmt, ##__VA_ARGS__)
#define ZF_LOG_ERROR(fmt, ...) zf::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define ZF_LOG_INFO(fmt, ...) (void)0
#define ZF_LOG_DEBUG(fmt, ...) (void)0
#define ZF_LOG_WARN(fmt, ...) (void)0
#define ZF_LOG_ERROR(fmt, ...) (void)0
#endif
