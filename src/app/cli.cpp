#include "hid/cli.hpp"

#include <cstdio>
#include <cstdlib>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "hid/query.hpp"

using namespace std::string_view_literals;

namespace hid {

void print_usage(const char *prog)
{
    std::println("Host identity resolver");
    std::println("Usage: {} [options] <host>[\\instance] ...", prog);
    std::println("Options:");
    std::println(
        "  --input-file PATH  Read host names from PATH, one per line (- = stdin)");
    std::println(
        "  --credential USER  Remote management user (default: calling identity)");
    std::println(
        "  --password-env V   Environment variable holding the password (default: HOSTIDENT_PASSWORD)");
    std::println(
        "  --dns-only         Skip management instrumentation, use DNS only");
    std::println("  --turbo            Alias of --dns-only");
    std::println(
        "  --timeout MS       Per network operation timeout (default: 2000)");
    std::println(
        "  --concurrency K    Number of hosts resolved in parallel (default: 1)");
    std::println("  --parallel K       Alias of --concurrency");
    std::println(
        "  --ns SERVER        Resolve DNS fallback with ldns against SERVER");
    std::println("  --tcp              Force TCP for --ns queries");
    std::println("  --json             Output results as one JSON array");
    std::println(
        "  --ndjson           Output each host as a single JSON line (NDJSON)");
    std::println(
        "  --attempts         Include the per-strategy attempt trace");
    std::println(
        "  -v, --verbose      More diagnostics on stderr (repeatable)");
    std::println(
        "  --log-level L      trace|debug|info|warn|error|off (default: warn)");
    std::println("  -h, --help         Show this help");
    std::println("");
    std::println("Environment:");
    std::println("  HOSTIDENT_LOG_LEVEL  initial log level");
    std::println("");
    std::println("Examples:");
    std::println("  {} 'sql2016\\sqlexpress'", prog);
    std::println("  {} --dns-only --json 10.0.0.5 web01", prog);
}

// "--name V" or "--name=V"; false when the flag is malformed
static bool take_value(std::string_view a,
                       std::string_view flag,
                       int &i,
                       int argc,
                       char **argv,
                       std::string &val)
{
    if (a == flag && i + 1 < argc)
    {
        val = argv[++i];
        return true;
    }
    if (a.size() > flag.size() + 1 && a.substr(flag.size(), 1) == "="sv)
    {
        val = std::string(a.substr(flag.size() + 1));
        return true;
    }
    std::println("invalid {} usage", flag);
    return false;
}

static bool is_flag(std::string_view a, std::string_view flag)
{
    return a == flag || (a.rfind(flag, 0) == 0 && a.size() > flag.size() &&
                         a[flag.size()] == '=');
}

static bool parse_int(const std::string &val, const char *what, int &out)
{
    try
    {
        size_t pos = 0;
        out = std::stoi(val, &pos);
        if (pos != val.size()) throw std::invalid_argument(val);
    }
    catch (const std::exception &)
    {
        std::println("invalid {}: {}", what, val);
        return false;
    }
    return true;
}

void apply_environment(Options &opt)
{
    const char *lvl = std::getenv("HOSTIDENT_LOG_LEVEL");
    if (!lvl || !*lvl) return;
    if (auto parsed = parse_log_level(lvl)) opt.log_level = *parsed;
    else std::println(stderr, "ignoring HOSTIDENT_LOG_LEVEL={}", lvl);
}

std::vector<std::string> read_input_lines(std::istream &in)
{
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line))
    {
        std::string_view v = trim_view(line);
        if (v.empty() || v.front() == '#') continue;
        out.emplace_back(v);
    }
    return out;
}

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return false;
        }
        if (a == "--dns-only"sv || a == "--turbo"sv)
        {
            opt.instrumentation = false;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--ndjson"sv)
        {
            opt.ndjson = true;
        }
        else if (a == "--attempts"sv)
        {
            opt.attempts = true;
        }
        else if (a == "--tcp"sv)
        {
            opt.tcp = true;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            if (opt.log_level > LogLevel::Trace)
                opt.log_level = static_cast<LogLevel>(
                    static_cast<int>(opt.log_level) - 1);
        }
        else if (a == "-vv"sv)
        {
            opt.log_level = LogLevel::Debug;
        }
        else if (is_flag(a, "--log-level"))
        {
            std::string val;
            if (!take_value(a, "--log-level", i, argc, argv, val)) return false;
            auto lvl = parse_log_level(val);
            if (!lvl)
            {
                std::println("unknown log level: {}", val);
                return false;
            }
            opt.log_level = *lvl;
        }
        else if (is_flag(a, "--input-file"))
        {
            if (!take_value(a, "--input-file", i, argc, argv, opt.input_file))
                return false;
        }
        else if (is_flag(a, "--credential"))
        {
            if (!take_value(a, "--credential", i, argc, argv, opt.user))
                return false;
        }
        else if (is_flag(a, "--password-env"))
        {
            if (!take_value(a, "--password-env", i, argc, argv, opt.password_env))
                return false;
        }
        else if (is_flag(a, "--ns"))
        {
            if (!take_value(a, "--ns", i, argc, argv, opt.ns)) return false;
        }
        else if (is_flag(a, "--timeout"))
        {
            std::string val;
            if (!take_value(a, "--timeout", i, argc, argv, val)) return false;
            if (!parse_int(val, "--timeout value", opt.timeout_ms)) return false;
            if (opt.timeout_ms < 0) opt.timeout_ms = 0;
        }
        else if (is_flag(a, "--concurrency") || is_flag(a, "--parallel"))
        {
            const std::string_view flag = is_flag(a, "--concurrency")
                                              ? "--concurrency"sv
                                              : "--parallel"sv;
            std::string val;
            if (!take_value(a, flag, i, argc, argv, val)) return false;
            if (!parse_int(val, "concurrency", opt.concurrency)) return false;
            if (opt.concurrency <= 0) opt.concurrency = 1;
        }
        else if (a.size() > 1 && a[0] == '-')
        {
            std::println("unknown option: {}", a);
            return false;
        }
        else
        {
            opt.inputs.emplace_back(a);
        }
    }
    if (opt.json && opt.ndjson)
    {
        std::println("--json and --ndjson are mutually exclusive");
        return false;
    }
    if (opt.inputs.empty() && opt.input_file.empty()) return false;
    return true;
}

} // namespace hid
