#include "hid/normalize.hpp"

#include "hid/query.hpp"

namespace hid
{
std::optional<std::string> compose_fqdn(const std::optional<std::string> &host,
                                        const std::optional<std::string> &domain)
{
    if (!host || !domain) return std::nullopt;
    const std::string_view h = trim_view(*host);
    const std::string_view d = trim_view(*domain);
    // rejects ".", ".corp.local" and "web01." alike
    if (h.empty() || d.empty()) return std::nullopt;

    std::string out;
    out.reserve(h.size() + 1 + d.size());
    out.append(h);
    out.push_back('.');
    out.append(d);
    return out;
}

IdentityRecord identity_from_dns_name(std::string_view host_part,
                                      std::string_view full_name)
{
    IdentityRecord id;
    id.name = std::string(host_part);

    full_name = trim_view(full_name);
    if (!full_name.empty() && full_name.back() == '.') full_name.remove_suffix(1);
    if (full_name.empty()) return id;

    const auto dot = full_name.find('.');
    const std::string_view label = full_name.substr(0, dot);
    if (label.empty()) return id;
    id.dns_host_name = std::string(label);

    if (dot != std::string_view::npos)
    {
        // strip exactly one "{label}." prefix
        const std::string_view rest = full_name.substr(label.size() + 1);
        if (!rest.empty()) id.domain = std::string(rest);
    }
    return id;
}

ResolvedHost normalize(const HostQuery &query,
                       const ReachabilityResult &reach,
                       const IdentityRecord &id)
{
    ResolvedHost out;
    out.input_name = query.raw_input;
    out.computer_name = id.name;
    out.ip_address = reach.ip_address;
    out.dns_host_name = id.dns_host_name;
    out.domain = id.domain;
    out.fqdn = compose_fqdn(id.dns_host_name, id.domain);
    return out;
}
} // namespace hid
