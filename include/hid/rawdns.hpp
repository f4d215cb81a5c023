#pragma once

#include <string>

#include "hid/transport.hpp"

namespace hid {

struct RawDnsConfig {
    std::string ns;      // server IP; empty = resolv.conf
    bool tcp = false;    // force TCP transport
    bool rd = true;      // recursion desired bit
};

// Host entry lookup through ldns against an explicit (or resolv.conf) server.
// PTR for IP literals, A via the search list otherwise; CNAME owners become
// aliases, the owner of the address record becomes the host name.
class LdnsHostLookup final : public HostLookup {
public:
    explicit LdnsHostLookup(RawDnsConfig cfg);

    HostEntry lookup(const std::string& host, int timeout_ms) override;

private:
    RawDnsConfig cfg_;
};

} // namespace hid
