// Host identity resolver (C++23)
// Resolves computer name, IPv4 address, DNS host name, domain and FQDN for
// each input using an echo probe and a fallback chain of identity lookups.

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "hid/cli.hpp"
#include "hid/concurrency.hpp"
#include "hid/icmp.hpp"
#include "hid/identity.hpp"
#include "hid/local_system.hpp"
#include "hid/log.hpp"
#include "hid/options.hpp"
#include "hid/output.hpp"
#include "hid/rawdns.hpp"
#include "hid/resolver.hpp"
#include "hid/usecases.hpp"

using namespace hid;

static Cancellation g_cancel;

extern "C" void on_interrupt(int)
{
    g_cancel.cancel();
}

static bool collect_inputs(const Options &opt, std::vector<std::string> &inputs)
{
    inputs = opt.inputs;
    if (opt.input_file.empty()) return true;
    if (opt.input_file == "-")
    {
        auto lines = read_input_lines(std::cin);
        inputs.insert(inputs.end(), lines.begin(), lines.end());
        return true;
    }
    std::ifstream in(opt.input_file);
    if (!in)
    {
        std::println(stderr, "cannot open input file: {}", opt.input_file);
        return false;
    }
    auto lines = read_input_lines(in);
    inputs.insert(inputs.end(), lines.begin(), lines.end());
    return true;
}

static std::optional<Credential> make_credential(const Options &opt)
{
    if (opt.user.empty()) return std::nullopt;
    Credential c;
    c.user = opt.user;
    if (const char *pw = std::getenv(opt.password_env.c_str()))
        c.password = pw;
    else
        log_warn("{} is not set, using an empty password for {}",
                 opt.password_env, opt.user);
    return c;
}

int main(int argc, char **argv)
{
    Options opt;
    if (argc <= 1)
    {
        print_usage(argv[0]);
        return 0;
    }
    apply_environment(opt);
    if (!parse_args(argc, argv, opt))
    {
        if (opt.inputs.empty() && opt.input_file.empty())
        {
            print_usage(argv[0]);
        }
        return 1;
    }
    set_log_level(opt.log_level);

    std::vector<std::string> inputs;
    if (!collect_inputs(opt, inputs)) return 1;
    if (inputs.empty())
    {
        std::println(stderr, "no host names given");
        return 1;
    }

    const std::optional<Credential> credential = make_credential(opt);

    // transports
    IcmpEchoTransport echo;
    LocalSessionTransport wsman(ManagementProtocol::WSMan);
    std::unique_ptr<HostLookup> dns;
    if (opt.ns.empty())
    {
        dns = std::make_unique<SystemHostLookup>();
    }
    else
    {
        RawDnsConfig cfg;
        cfg.ns = opt.ns;
        cfg.tcp = opt.tcp;
        dns = std::make_unique<LdnsHostLookup>(cfg);
    }

    // Strategy order: WSMan session, DCOM session, legacy object query, DNS.
    // No DCOM or legacy transport exists on this platform.
    IdentityResolver identity;
    identity.add(std::make_unique<SessionQueryStrategy>(wsman));
    identity.add(std::make_unique<DnsNameStrategy>(*dns));

    ResolverConfig config;
    config.instrumentation_available = opt.instrumentation;
    config.timeout_ms = opt.timeout_ms;
    HostResolver resolver(echo, identity, config);

    std::signal(SIGINT, on_interrupt);

    if (!opt.json && !opt.ndjson)
    {
        std::print("{}", format_header_text(opt, inputs.size()));
    }

    // emit in input order as soon as the completed prefix grows
    std::mutex print_mtx;
    std::vector<std::optional<ResolveItem>> pending(inputs.size());
    size_t next_out = 0;
    auto on_item = [&](size_t idx, const ResolveItem &item)
    {
        if (opt.json) return;
        std::scoped_lock lk(print_mtx);
        pending[idx] = item;
        while (next_out < pending.size() && pending[next_out])
        {
            const ResolveItem &ready = *pending[next_out];
            if (opt.ndjson)
                std::println("{}", build_ndjson_item(next_out, ready, opt.attempts));
            else
                std::print("\n{}", format_item_text(ready, opt.attempts));
            std::fflush(stdout);
            pending[next_out].reset();
            ++next_out;
        }
    };

    auto t0 = std::chrono::steady_clock::now();
    std::vector<ResolveItem> items = resolver.resolve_all(
        inputs, credential, opt.concurrency, on_item, &g_cancel);
    auto t1 = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double, std::milli>(t1 - t0).count();

    size_t resolved = 0;
    size_t rejected = 0;
    for (const auto &it: items)
    {
        if (it.status == ItemStatus::InvalidInput) ++rejected;
        else if (it.status == ItemStatus::Ok &&
                 (it.host.computer_name || it.host.dns_host_name))
            ++resolved;
    }

    if (opt.json)
    {
        std::println("{}", build_final_json(items, opt.attempts));
    }
    else if (!opt.ndjson)
    {
        std::print("\n{}", format_summary_text(items.size(), resolved, rejected,
                                               elapsed));
    }

    return rejected > 0 ? 2 : 0;
}
