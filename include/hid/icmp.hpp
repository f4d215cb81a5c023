#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "hid/transport.hpp"

namespace hid
{
// One ICMP echo over IPv4. Prefers an unprivileged datagram ICMP socket and
// falls back to a raw socket (needs CAP_NET_RAW).
class IcmpEchoTransport final : public EchoTransport
{
public:
    EchoReply echo(const std::string &host, int timeout_ms) override;
};

uint16_t icmp_checksum(const void *data, size_t len);
} // namespace hid
