#pragma once

#include <string>
#include <vector>

#include "hid/log.hpp"

namespace hid
{
struct Options
{
    std::vector<std::string> inputs;   // positional host names
    std::string input_file;            // one name per line, "-" = stdin
    // credential (empty user = calling identity)
    std::string user;
    std::string password_env = "HOSTIDENT_PASSWORD";
    bool instrumentation = true;       // false with --dns-only
    int timeout_ms = 2000;             // per network operation
    int concurrency = 1;               // parallel resolutions
    // DNS fallback backend
    std::string ns;                    // when non-empty, use ldns against this server
    bool tcp = false;                  // force TCP for ldns
    // output
    bool json = false;
    bool ndjson = false;
    bool attempts = false;             // include per-strategy trace
    LogLevel log_level = LogLevel::Warn;
};
} // namespace hid
