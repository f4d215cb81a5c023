#include "hid/icmp.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>

// POSIX networking
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "hid/fd.hpp"
#include "hid/resolver.hpp"

namespace hid
{
namespace
{
constexpr size_t kPayloadSize = 16;

std::atomic<uint16_t> g_next_seq{1};

std::string errno_str(const char *what)
{
    return std::string(what) + ": " + std::strerror(errno);
}
} // namespace

uint16_t icmp_checksum(const void *data, size_t len)
{
    const auto *p = static_cast<const uint8_t *>(data);
    uint32_t sum = 0;
    for (; len > 1; len -= 2, p += 2)
        sum += static_cast<uint32_t>(p[0] << 8 | p[1]);
    if (len == 1) sum += static_cast<uint32_t>(p[0] << 8);
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return htons(static_cast<uint16_t>(~sum));
}

EchoReply IcmpEchoTransport::echo(const std::string &host, int timeout_ms)
{
    EchoReply out{};
    auto t0 = std::chrono::steady_clock::now();
    auto elapsed_ms = [&]
    {
        auto t1 = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(t1 - t0).count();
    };
    auto fail = [&](FailureKind kind, std::string err)
    {
        out.kind = kind;
        out.error = std::move(err);
        out.ms = elapsed_ms();
        return out;
    };

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res = nullptr;
    if (int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res); rc != 0)
    {
        if (res) freeaddrinfo(res);
        return fail(failure_from_gai(rc), std::string("getaddrinfo: ") + gai_strerror(rc));
    }
    sockaddr_in dest{};
    std::memcpy(&dest, res->ai_addr, sizeof(dest));
    freeaddrinfo(res);

    bool raw = false;
    Fd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
    if (!fd)
    {
        fd.reset(::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP));
        raw = true;
    }
    if (!fd) return fail(FailureKind::NotAvailable, errno_str("icmp socket"));

    const uint16_t id = static_cast<uint16_t>(::getpid() & 0xFFFF);
    const uint16_t seq = g_next_seq.fetch_add(1, std::memory_order_relaxed);

    uint8_t pkt[sizeof(icmphdr) + kPayloadSize]{};
    auto *hdr = reinterpret_cast<icmphdr *>(pkt);
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = htons(id);
    hdr->un.echo.sequence = htons(seq);
    for (size_t i = 0; i < kPayloadSize; ++i)
        pkt[sizeof(icmphdr) + i] = static_cast<uint8_t>('a' + i);
    hdr->checksum = 0;
    hdr->checksum = icmp_checksum(pkt, sizeof(pkt));

    if (::sendto(fd.get(), pkt, sizeof(pkt), 0,
                 reinterpret_cast<const sockaddr *>(&dest), sizeof(dest)) < 0)
    {
        return fail(FailureKind::ConnectFailed, errno_str("sendto"));
    }

    const auto deadline = t0 + std::chrono::milliseconds(timeout_ms);
    uint8_t buf[1500];
    for (;;)
    {
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remain <= 0) break;

        pollfd pfd{fd.get(), POLLIN, 0};
        int pr = ::poll(&pfd, 1, static_cast<int>(remain));
        if (pr < 0)
        {
            if (errno == EINTR) continue;
            return fail(FailureKind::QueryFailed, errno_str("poll"));
        }
        if (pr == 0) break;

        sockaddr_in from{};
        socklen_t flen = sizeof(from);
        ssize_t n = ::recvfrom(fd.get(), buf, sizeof(buf), 0,
                               reinterpret_cast<sockaddr *>(&from), &flen);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            return fail(FailureKind::QueryFailed, errno_str("recvfrom"));
        }

        size_t off = 0;
        if (raw)
        {
            if (n < static_cast<ssize_t>(sizeof(iphdr))) continue;
            off = reinterpret_cast<const iphdr *>(buf)->ihl * 4u;
        }
        if (n < static_cast<ssize_t>(off + sizeof(icmphdr))) continue;
        const auto *reply = reinterpret_cast<const icmphdr *>(buf + off);
        if (reply->type != ICMP_ECHOREPLY) continue;
        if (ntohs(reply->un.echo.sequence) != seq) continue;
        // the kernel rewrites the id of datagram ICMP sockets
        if (raw && ntohs(reply->un.echo.id) != id) continue;

        char ip[INET_ADDRSTRLEN]{};
        if (!inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip)))
            return fail(FailureKind::QueryFailed, errno_str("inet_ntop"));
        out.address = ip;
        out.ms = elapsed_ms();
        return out;
    }

    return fail(FailureKind::Timeout,
                "no echo reply within " + std::to_string(timeout_ms) + " ms");
}
} // namespace hid
