#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace hid
{
enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Off };

const char *log_level_str(LogLevel lvl);

// "trace", "debug", "info", "warn", "error", "off" (case-insensitive)
std::optional<LogLevel> parse_log_level(std::string_view s);

void     set_log_level(LogLevel lvl);
LogLevel log_level();

inline bool log_enabled(LogLevel lvl)
{
    return lvl != LogLevel::Off && lvl >= log_level();
}

// Replaces the stderr writer; an empty function restores it. The sink runs
// outside the log lock and may be called from several threads at once.
using LogSink = std::function<void(LogLevel, std::string_view)>;
void set_log_sink(LogSink sink);

void log_message(LogLevel lvl, std::string_view msg);

template <class... Args>
void log_at(LogLevel lvl, std::format_string<Args...> fmt, Args &&...args)
{
    if (!log_enabled(lvl)) return;
    log_message(lvl, std::format(fmt, std::forward<Args>(args)...));
}

template <class... Args>
void log_trace(std::format_string<Args...> fmt, Args &&...args)
{
    log_at(LogLevel::Trace, fmt, std::forward<Args>(args)...);
}

template <class... Args>
void log_debug(std::format_string<Args...> fmt, Args &&...args)
{
    log_at(LogLevel::Debug, fmt, std::forward<Args>(args)...);
}

template <class... Args>
void log_info(std::format_string<Args...> fmt, Args &&...args)
{
    log_at(LogLevel::Info, fmt, std::forward<Args>(args)...);
}

template <class... Args>
void log_warn(std::format_string<Args...> fmt, Args &&...args)
{
    log_at(LogLevel::Warn, fmt, std::forward<Args>(args)...);
}

template <class... Args>
void log_error(std::format_string<Args...> fmt, Args &&...args)
{
    log_at(LogLevel::Error, fmt, std::forward<Args>(args)...);
}
} // namespace hid
