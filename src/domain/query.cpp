#include "hid/query.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace hid
{
namespace
{
constexpr size_t kMaxHostLength = 253;

bool is_host_char(unsigned char c)
{
    return std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == ':' ||
           c == '%';
}

std::string describe(std::string_view raw)
{
    return "invalid host name '" + std::string(raw) + "'";
}
} // namespace

InvalidHostError::InvalidHostError(std::string input, const std::string &reason)
    : std::invalid_argument(reason), input_(std::move(input))
{
}

std::string_view trim_view(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool is_ipv4_literal(std::string_view host)
{
    in_addr a{};
    return inet_pton(AF_INET, std::string(host).c_str(), &a) == 1;
}

bool is_ipv6_literal(std::string_view host)
{
    // zone index ("fe80::1%eth0") is not understood by inet_pton
    if (const auto pct = host.find('%'); pct != std::string_view::npos)
        host = host.substr(0, pct);
    in6_addr a{};
    return inet_pton(AF_INET6, std::string(host).c_str(), &a) == 1;
}

bool is_ip_literal(std::string_view host)
{
    return is_ipv4_literal(host) || is_ipv6_literal(host);
}

HostQuery make_host_query(std::string_view raw)
{
    std::string_view host = raw;
    if (const auto bs = host.find('\\'); bs != std::string_view::npos)
        host = host.substr(0, bs);
    host = trim_view(host);

    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    {
        host = host.substr(1, host.size() - 2);
        if (!is_ipv6_literal(host))
            throw InvalidHostError(std::string(raw),
                                   describe(raw) + ": bracketed value is not an IPv6 address");
    }

    if (host.empty())
        throw InvalidHostError(std::string(raw), describe(raw) + ": empty host part");
    if (host.size() > kMaxHostLength)
        throw InvalidHostError(std::string(raw), describe(raw) + ": longer than 253 characters");
    if (!std::ranges::all_of(host, [](char c) { return is_host_char(static_cast<unsigned char>(c)); }))
        throw InvalidHostError(std::string(raw), describe(raw) + ": unexpected character");
    if (host.front() == '.' && host != ".")
        throw InvalidHostError(std::string(raw), describe(raw) + ": empty leading label");

    HostQuery q;
    q.raw_input = std::string(raw);
    q.host_part = std::string(host);
    return q;
}
} // namespace hid
