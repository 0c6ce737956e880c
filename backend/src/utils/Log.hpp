#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace pb::log
{

// Non-templated pieces live in Log.cpp.
void append_log_line_to_file(std::string const &line);
void set_log_file(std::string path);
void set_verbose(bool enabled) noexcept;
bool verbose() noexcept;

// If PB_ENABLE_LOGGING is defined and non-zero, it takes absolute
// precedence over PB_BUILD_MINIMAL so logs can be turned on in stripped
// builds for diagnostics.
#if defined(PB_ENABLE_LOGGING) && (PB_ENABLE_LOGGING)
#define PB_LOGGING_ACTIVE 1
#elif !defined(PB_BUILD_MINIMAL)
#define PB_LOGGING_ACTIVE 1
#else
#define PB_LOGGING_ACTIVE 0
#endif

#if PB_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
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

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace pb::log

#if PB_LOGGING_ACTIVE
#define PB_LOG_INFO(fmt, ...) pb::log::write_line('I', fmt, ##__VA_ARGS__)
#define PB_LOG_DEBUG(fmt, ...)                                                 \
    do                                                                         \
    {                                                                          \
        if (pb::log::verbose())                                                \
        {                                                                      \
            pb::log::write_line('D', fmt, ##__VA_ARGS__);                      \
        }                                                                      \
    } while (false)
#define PB_LOG_WARN(fmt, ...) pb::log::write_line('W', fmt, ##__VA_ARGS__)
#define PB_LOG_ERROR(fmt, ...) pb::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define PB_LOG_INFO(fmt, ...) (void)0
#define PB_LOG_DEBUG(fmt, ...) (void)0
#define PB_LOG_WARN(fmt, ...) (void)0
#define PB_LOG_ERROR(fmt, ...) (void)0
#endif
