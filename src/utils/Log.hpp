#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sw::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Accepts DEBUG, INFO, WARN/WARNING, ERROR/CRITICAL (any case).
std::optional<Level> parse_level(std::string_view value);

void set_level(Level level) noexcept;
Level level() noexcept;

inline bool enabled(Level value) noexcept
{
    return static_cast<int>(value) >= static_cast<int>(level());
}

// Lines are mirrored to this file once set. An empty path disables the file
// sink and leaves only stderr.
void set_log_file(std::filesystem::path path);

// Forward declaration for non-templated file append (defined in Log.cpp).
void append_log_line_to_file(std::string const &line);

// Renames a non-empty log file to <stem>-YYYYMMDD-HHMMSS<ext> (mtime, UTC)
// and deletes the oldest rotated files beyond max_files. max_files <= 0 keeps
// every rotated file. Returns the rotated path when a rename happened.
std::optional<std::filesystem::path>
rotate_log_file(std::filesystem::path const &path, int max_files);

template <typename... Args>
inline void write_line(Level severity, char tag, std::string_view fmt,
                       Args &&...args)
{
    if (!enabled(severity))
    {
        return;
    }
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
    // Format millis as 3 digits without a compile-time format string.
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(tag);
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

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
}

} // namespace sw::log

#define SW_LOG_DEBUG(fmt, ...)                                                 \
    sw::log::write_line(sw::log::Level::Debug, 'D', fmt, ##__VA_ARGS__)
#define SW_LOG_INFO(fmt, ...)                                                  \
    sw::log::write_line(sw::log::Level::Info, 'I', fmt, ##__VA_ARGS__)
#define SW_LOG_WARN(fmt, ...)                                                  \
    sw::log::write_line(sw::log::Level::Warn, 'W', fmt, ##__VA_ARGS__)
#define SW_LOG_ERROR(fmt, ...)                                                 \
    sw::log::write_line(sw::log::Level::Error, 'E', fmt, ##__VA_ARGS__)
