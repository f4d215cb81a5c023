#include "hid/output.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

#include "hid/model.hpp"
#include "hid/options.hpp"

namespace hid {

static const char* on_off(bool b)
{
    return b ? "on" : "off";
}

static std::string or_none(const std::optional<std::string>& s)
{
    return s ? *s : std::string("(none)");
}

std::string format_header_text(const Options& opt, size_t input_count)
{
    std::ostringstream os;
    os << "Resolving: " << input_count << " host(s)\n";
    os << "Timeout: " << opt.timeout_ms << " ms"
       << "  Concurrency: " << opt.concurrency
       << "  Instrumentation: " << on_off(opt.instrumentation) << '\n';
    os << "Credential: " << (opt.user.empty() ? "(default)" : opt.user.c_str())
       << "  DNS: " << (opt.ns.empty() ? "system" : "ldns");
    if (!opt.ns.empty())
    {
        os << " ns=" << opt.ns << " tcp=" << on_off(opt.tcp);
    }
    os << '\n';
    return os.str();
}

std::string format_attempts_text(const std::vector<StrategyOutcome>& attempts)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    for (const auto& a : attempts)
    {
        os << "  - " << a.strategy << ": " << failure_str(a.kind);
        if (!a.ok() && !a.error.empty()) os << " <" << a.error << ">";
        os << "  " << a.ms << " ms\n";
    }
    return os.str();
}

std::string format_item_text(const ResolveItem& item, bool with_attempts)
{
    std::ostringstream os;
    os << "Input:        " << item.input << '\n';
    if (item.status != ItemStatus::Ok)
    {
        os << "  error: " << item.error << '\n';
        return os.str();
    }
    const ResolvedHost& h = item.host;
    os << "ComputerName: " << or_none(h.computer_name) << '\n';
    os << "IPAddress:    " << or_none(h.ip_address) << '\n';
    os << "DNSHostName:  " << or_none(h.dns_host_name) << '\n';
    os << "Domain:       " << or_none(h.domain) << '\n';
    os << "FQDN:         " << or_none(h.fqdn) << '\n';
    if (with_attempts && !item.attempts.empty())
    {
        os << "Attempts:\n" << format_attempts_text(item.attempts);
    }
    return os.str();
}

std::string format_summary_text(size_t total,
                                size_t resolved,
                                size_t rejected,
                                double elapsed_ms)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "summary: " << total << " input(s), "
       << resolved << " resolved, "
       << rejected << " rejected in "
       << elapsed_ms << " ms\n";
    return os.str();
}

} // namespace hid
