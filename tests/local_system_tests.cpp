#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hid/icmp.hpp"
#include "hid/identity.hpp"
#include "hid/local_system.hpp"
#include "hid/log.hpp"

using namespace hid;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static LocalIdentity fixed_identity()
{
    LocalIdentity self;
    self.node_name = "SQL2016.corp.example.com";
    self.short_name = "SQL2016";
    self.fqdn = "SQL2016.corp.example.com";
    return self;
}

static void test_is_local_target()
{
    const LocalIdentity self = fixed_identity();
    assert_true(is_local_target(".", self), "dot");
    assert_true(is_local_target("localhost", self), "localhost");
    assert_true(is_local_target("LOCALHOST", self), "case-insensitive");
    assert_true(is_local_target("127.0.0.1", self), "ipv4 loopback");
    assert_true(is_local_target("127.8.9.10", self), "loopback /8");
    assert_true(is_local_target("::1", self), "ipv6 loopback");
    assert_true(is_local_target("sql2016", self), "short name");
    assert_true(is_local_target("sql2016.corp.example.com", self), "fqdn");
    assert_true(!is_local_target("web01", self), "other name");
    assert_true(!is_local_target("192.0.2.200", self), "documentation address");
}

static void test_system_info_from_local()
{
    ComputerSystemInfo info = system_info_from_local(fixed_identity());
    assert_true(info.name == std::optional<std::string>("SQL2016"), "name");
    assert_true(info.dns_host_name == std::optional<std::string>("SQL2016"), "dns name");
    assert_true(info.domain == std::optional<std::string>("corp.example.com"), "domain");

    LocalIdentity bare;
    bare.node_name = "box";
    bare.short_name = "box";
    bare.fqdn = "box";
    info = system_info_from_local(bare);
    assert_true(info.name && !info.domain, "no domain for an unqualified host");

    info = system_info_from_local(LocalIdentity{});
    assert_true(!info.name && !info.caption, "unknown identity stays empty");
}

static void test_remote_target_not_available()
{
    LocalSessionTransport t(ManagementProtocol::WSMan);
    SessionOpen open = t.open_session("192.0.2.200", std::nullopt, 100);
    assert_true(open.kind == FailureKind::NotAvailable, "remote not available");
    assert_true(!open.session, "no session");
    assert_true(open.error.rfind("wsman:", 0) == 0, "protocol named in error");
}

static void test_local_session_round_trip()
{
    int closed = 0;
    set_log_level(LogLevel::Trace);
    set_log_sink([&](LogLevel, std::string_view msg)
    {
        if (msg.find("session") != std::string_view::npos &&
            msg.find("closed") != std::string_view::npos)
            ++closed;
    });

    LocalSessionTransport t(ManagementProtocol::Dcom);
    SessionQueryStrategy strategy(t);
    StrategyOutcome o = strategy.query(".", std::nullopt, 100);

    set_log_sink({});
    set_log_level(LogLevel::Warn);

    assert_true(std::string_view(strategy.name()) == "dcom", "strategy name");
    if (read_local_identity().short_name.empty())
    {
        assert_true(o.kind == FailureKind::QueryFailed, "no local name");
    }
    else
    {
        assert_true(o.ok(), "local query succeeds");
        assert_true(o.record.name.has_value(), "local name");
    }
    assert_true(closed == 1, "session closed once");
}

static void test_icmp_checksum()
{
    // RFC 1071 example words 0001 f203 f4f5 f6f7
    const unsigned char data[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    const uint16_t sum = icmp_checksum(data, sizeof(data));
    // one's-complement sum is 0xddf2, checksum is its complement in network order
    const unsigned char *b = reinterpret_cast<const unsigned char *>(&sum);
    assert_true(b[0] == 0x22 && b[1] == 0x0d, "rfc1071 checksum");

    const unsigned char odd[] = {0xff};
    const uint16_t s2 = icmp_checksum(odd, sizeof(odd));
    const unsigned char *c = reinterpret_cast<const unsigned char *>(&s2);
    assert_true(c[0] == 0x00 && c[1] == 0xff, "odd length pads with zero");
}

int main()
{
    test_is_local_target();
    test_system_info_from_local();
    test_remote_target_not_available();
    test_local_session_round_trip();
    test_icmp_checksum();

    std::cout << "local system tests: OK" << std::endl;
    return 0;
}
