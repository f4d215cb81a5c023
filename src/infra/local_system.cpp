#include "hid/local_system.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/utsname.h>

#include "hid/log.hpp"
#include "hid/query.hpp"

namespace hid
{
namespace
{
std::string lower(std::string_view s)
{
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string canonical_name(const std::string &node)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = AI_CANONNAME;
    addrinfo *res = nullptr;
    std::string out;
    if (getaddrinfo(node.c_str(), nullptr, &hints, &res) == 0 && res &&
        res->ai_canonname)
    {
        out = res->ai_canonname;
    }
    if (res) freeaddrinfo(res);
    return out;
}

bool is_loopback(std::string_view host)
{
    if (host == "::1") return true;
    in_addr a{};
    if (inet_pton(AF_INET, std::string(host).c_str(), &a) != 1) return false;
    return (ntohl(a.s_addr) >> 24) == 127;
}

std::vector<std::string> interface_addresses()
{
    std::vector<std::string> out;
    ifaddrs *ifa = nullptr;
    if (getifaddrs(&ifa) != 0) return out;
    char buf[INET6_ADDRSTRLEN]{};
    for (const ifaddrs *p = ifa; p != nullptr; p = p->ifa_next)
    {
        if (!p->ifa_addr) continue;
        const char *ok = nullptr;
        if (p->ifa_addr->sa_family == AF_INET)
        {
            const auto *sin = reinterpret_cast<const sockaddr_in *>(p->ifa_addr);
            ok = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        }
        else if (p->ifa_addr->sa_family == AF_INET6)
        {
            const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(p->ifa_addr);
            ok = inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        }
        if (ok) out.emplace_back(buf);
    }
    freeifaddrs(ifa);
    return out;
}

class LocalSession final : public ManagementSession
{
public:
    explicit LocalSession(LocalIdentity self) : self_(std::move(self)) {}
    ~LocalSession() override { log_trace("local session for {} closed", self_.node_name); }

    SystemQueryReply query_computer_system(int /*timeout_ms*/) override
    {
        SystemQueryReply reply{};
        reply.info = system_info_from_local(self_);
        return reply;
    }

private:
    LocalIdentity self_;
};
} // namespace

LocalIdentity read_local_identity()
{
    LocalIdentity self;
    utsname u{};
    if (uname(&u) == 0) self.node_name = u.nodename;
    self.short_name = self.node_name.substr(0, self.node_name.find('.'));

    std::string canon = canonical_name(self.node_name);
    if (canon.find('.') != std::string::npos)
        self.fqdn = std::move(canon);
    else if (self.node_name.find('.') != std::string::npos)
        self.fqdn = self.node_name;
    else
        self.fqdn = self.short_name;
    return self;
}

bool is_local_target(std::string_view host, const LocalIdentity &self)
{
    const std::string h = lower(host);
    if (h == "." || h == "localhost" || h == "localhost.localdomain") return true;
    if (!self.short_name.empty() &&
        (h == lower(self.node_name) || h == lower(self.short_name) ||
         h == lower(self.fqdn)))
    {
        return true;
    }
    if (!is_ip_literal(h)) return false;
    if (is_loopback(h)) return true;
    const auto addrs = interface_addresses();
    return std::ranges::find(addrs, h) != addrs.end();
}

ComputerSystemInfo system_info_from_local(const LocalIdentity &self)
{
    ComputerSystemInfo info;
    if (self.short_name.empty()) return info;
    info.name = self.short_name;
    info.caption = self.node_name;
    info.dns_host_name = self.short_name;
    const std::string prefix = self.short_name + ".";
    if (self.fqdn.size() > prefix.size() &&
        lower(self.fqdn.substr(0, prefix.size())) == lower(prefix))
    {
        info.domain = self.fqdn.substr(prefix.size());
    }
    return info;
}

LocalSessionTransport::LocalSessionTransport(ManagementProtocol protocol)
    : protocol_(protocol)
{
}

SessionOpen LocalSessionTransport::open_session(
    const std::string &host,
    const std::optional<Credential> &credential,
    int /*timeout_ms*/)
{
    SessionOpen out{};
    LocalIdentity self = read_local_identity();
    if (!is_local_target(host, self))
    {
        out.kind = FailureKind::NotAvailable;
        out.error = std::string(protocol_str(protocol_)) +
                    ": no remote management endpoint on this platform";
        return out;
    }
    if (credential)
        log_debug("{}: credential for '{}' not needed for a local session",
                  host, credential->user);
    out.session = std::make_unique<LocalSession>(std::move(self));
    return out;
}
} // namespace hid
