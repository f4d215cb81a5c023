#include "hid/resolver.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

// POSIX networking
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include "hid/query.hpp"

namespace hid
{
static std::vector<std::string> collect_addresses(const addrinfo *res)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    char buf[INET6_ADDRSTRLEN]{};
    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        const char *ok = nullptr;
        if (ai->ai_family == AF_INET)
        {
            const auto *sin = reinterpret_cast<const sockaddr_in *>(ai->
                ai_addr);
            ok = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        }
        else if (ai->ai_family == AF_INET6)
        {
            const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(ai->
                ai_addr);
            ok = inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        }
        if (!ok) continue;
        std::string ip{buf};
        if (!seen.insert(ip).second) continue;
        out.push_back(std::move(ip));
    }
    // IPv4 first, matching what the echo probe reports
    std::ranges::stable_partition(out, [](const std::string &ip)
    {
        return ip.find(':') == std::string::npos;
    });
    return out;
}

static bool iequals(std::string_view a, std::string_view b)
{
    return std::ranges::equal(a, b, [](char x, char y)
    {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

FailureKind failure_from_gai(int rc)
{
    switch (rc)
    {
        case 0: return FailureKind::None;
        case EAI_NONAME:
#ifdef EAI_NODATA
        case EAI_NODATA:
#endif
            return FailureKind::NotFound;
        case EAI_AGAIN: return FailureKind::Timeout;
        default: return FailureKind::QueryFailed;
    }
}

std::string reverse_name(const std::string &ip, int *rc_out)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = AI_NUMERICHOST;
    addrinfo *res = nullptr;
    int rc = getaddrinfo(ip.c_str(), nullptr, &hints, &res);
    if (rc != 0)
    {
        if (rc_out) *rc_out = rc;
        if (res) freeaddrinfo(res);
        return {};
    }

    char name[NI_MAXHOST]{};
    rc = getnameinfo(res->ai_addr,
                     res->ai_addrlen,
                     name,
                     sizeof(name),
                     nullptr,
                     0,
                     NI_NAMEREQD);
    freeaddrinfo(res);
    if (rc_out) *rc_out = rc;
    if (rc != 0) return {};
    return std::string{name};
}

HostEntry SystemHostLookup::lookup(const std::string &host, int /*timeout_ms*/)
{
    HostEntry entry{};

    if (is_ip_literal(host))
    {
        entry.addresses.push_back(host);
        int rc = 0;
        entry.host_name = reverse_name(host, &rc);
        if (entry.host_name.empty())
        {
            entry.kind = rc == 0 ? FailureKind::NotFound : failure_from_gai(rc);
            entry.error = "reverse lookup of " + host + ": " +
                          (rc == 0 ? "no name" : gai_strerror(rc));
        }
        return entry;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM; // one entry per address
    hints.ai_flags = AI_CANONNAME | AI_ADDRCONFIG;

    addrinfo *res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0)
    {
        entry.kind = failure_from_gai(rc);
        entry.error = "getaddrinfo " + host + ": " + gai_strerror(rc);
        if (res) freeaddrinfo(res);
        return entry;
    }

    entry.addresses = collect_addresses(res);
    entry.host_name = (res && res->ai_canonname)
                          ? std::string(res->ai_canonname)
                          : host;
    freeaddrinfo(res);

    // Qualify a bare canonical name through the PTR of its first address,
    // but only when that PTR names the same host.
    if (entry.host_name.find('.') == std::string::npos &&
        !entry.addresses.empty())
    {
        std::string ptr = reverse_name(entry.addresses.front());
        const auto dot = ptr.find('.');
        if (dot != std::string::npos &&
            iequals(std::string_view(ptr).substr(0, dot), entry.host_name))
        {
            entry.host_name = std::move(ptr);
        }
    }
    if (!iequals(entry.host_name, host)) entry.aliases.push_back(host);
    return entry;
}
} // namespace hid
