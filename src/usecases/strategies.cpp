#include "hid/identity.hpp"

#include <chrono>

#include "hid/normalize.hpp"
#include "hid/query.hpp"

namespace hid
{
namespace
{
// trimmed value, nullopt when absent or blank
std::optional<std::string> non_blank(const std::optional<std::string> &s)
{
    if (!s) return std::nullopt;
    const std::string_view v = trim_view(*s);
    if (v.empty()) return std::nullopt;
    return std::string(v);
}

double ms_since(std::chrono::steady_clock::time_point t0)
{
    auto t1 = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

void apply_reply(StrategyOutcome &out, const SystemQueryReply &reply)
{
    if (reply.kind != FailureKind::None)
    {
        out.kind = reply.kind;
        out.error = reply.error;
        return;
    }
    out.record = identity_from_system_info(reply.info);
    if (out.record.empty())
    {
        out.kind = FailureKind::QueryFailed;
        out.error = "query returned no identity fields";
    }
}
} // namespace

IdentityRecord identity_from_system_info(const ComputerSystemInfo &info)
{
    IdentityRecord id;
    id.name = non_blank(info.name);
    if (!id.name) id.name = non_blank(info.caption);
    id.dns_host_name = non_blank(info.dns_host_name);
    id.domain = non_blank(info.domain);
    return id;
}

SessionQueryStrategy::SessionQueryStrategy(ManagementTransport &transport)
    : transport_(transport)
{
}

const char *SessionQueryStrategy::name() const
{
    return protocol_str(transport_.protocol());
}

StrategyOutcome SessionQueryStrategy::query(
    const std::string &host,
    const std::optional<Credential> &credential,
    int timeout_ms)
{
    StrategyOutcome out{};
    out.strategy = name();
    auto t0 = std::chrono::steady_clock::now();

    SessionOpen open = transport_.open_session(host, credential, timeout_ms);
    if (open.kind != FailureKind::None || !open.session)
    {
        out.kind = open.kind == FailureKind::None
                       ? FailureKind::ConnectFailed
                       : open.kind;
        out.error = open.error.empty() ? "no session" : open.error;
        out.ms = ms_since(t0);
        return out;
    }

    SystemQueryReply reply = open.session->query_computer_system(timeout_ms);
    // close before control goes back to the resolver
    open.session.reset();

    apply_reply(out, reply);
    out.ms = ms_since(t0);
    return out;
}

ObjectQueryStrategy::ObjectQueryStrategy(ObjectQuery &query) : query_(query)
{
}

StrategyOutcome ObjectQueryStrategy::query(
    const std::string &host,
    const std::optional<Credential> &credential,
    int timeout_ms)
{
    StrategyOutcome out{};
    out.strategy = name();
    auto t0 = std::chrono::steady_clock::now();
    apply_reply(out, query_.query_computer_system(host, credential, timeout_ms));
    out.ms = ms_since(t0);
    return out;
}

DnsNameStrategy::DnsNameStrategy(HostLookup &lookup) : lookup_(lookup)
{
}

StrategyOutcome DnsNameStrategy::query(
    const std::string &host,
    const std::optional<Credential> & /*credential*/,
    int timeout_ms)
{
    StrategyOutcome out{};
    out.strategy = name();
    auto t0 = std::chrono::steady_clock::now();

    HostEntry entry = lookup_.lookup(host, timeout_ms);
    out.ms = ms_since(t0);
    if (entry.kind != FailureKind::None)
    {
        out.kind = entry.kind;
        out.error = entry.error;
        return out;
    }
    if (trim_view(entry.host_name).empty())
    {
        out.kind = FailureKind::NotFound;
        out.error = "host entry without a name";
        return out;
    }
    out.record = identity_from_dns_name(host, entry.host_name);
    return out;
}
} // namespace hid
