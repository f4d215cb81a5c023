#pragma once

#include <string>

#include "hid/transport.hpp"

namespace hid
{
// System resolver (getaddrinfo / getnameinfo) host entry lookup.
// - IP literals are reverse-resolved with NI_NAMEREQD
// - names use AI_CANONNAME; an unqualified canonical name is upgraded with a
//   reverse lookup of the first address when that yields a dotted name
// The timeout is governed by resolv.conf, timeout_ms is not applied here.
class SystemHostLookup final : public HostLookup
{
public:
    HostEntry lookup(const std::string &host, int timeout_ms) override;
};

// getnameinfo() for one textual address; empty on failure
std::string reverse_name(const std::string &ip, int *rc_out = nullptr);

// EAI_* code to FailureKind
FailureKind failure_from_gai(int rc);
} // namespace hid
