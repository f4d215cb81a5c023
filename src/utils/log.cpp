#include "hid/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <print>
#include <string>
#include <utility>

namespace hid
{
namespace
{
std::mutex g_log_mtx;
std::atomic<LogLevel> g_level{LogLevel::Warn};
LogSink g_sink; // guarded by g_log_mtx
} // namespace

const char *log_level_str(const LogLevel lvl)
{
    switch (lvl)
    {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(std::string_view s)
{
    std::string v(s);
    std::ranges::transform(v, v.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "off" || v == "none") return LogLevel::Off;
    return std::nullopt;
}

void set_log_level(LogLevel lvl)
{
    g_level.store(lvl, std::memory_order_relaxed);
}

LogLevel log_level()
{
    return g_level.load(std::memory_order_relaxed);
}

void set_log_sink(LogSink sink)
{
    std::scoped_lock lk(g_log_mtx);
    g_sink = std::move(sink);
}

void log_message(LogLevel lvl, std::string_view msg)
{
    LogSink sink;
    {
        std::scoped_lock lk(g_log_mtx);
        if (!g_sink)
        {
            std::println(stderr, "[{}] {}", log_level_str(lvl), msg);
            return;
        }
        sink = g_sink;
    }
    // called unlocked, a sink may log itself
    sink(lvl, msg);
}
} // namespace hid
