#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "hid/identity.hpp"
#include "hid/normalize.hpp"
#include "hid/query.hpp"

using namespace hid;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void test_compose_fqdn()
{
    assert_true(compose_fqdn("web01", "corp.example.com") ==
                    std::optional<std::string>("web01.corp.example.com"),
                "both parts present");
    assert_true(!compose_fqdn(std::nullopt, "corp"), "host absent");
    assert_true(!compose_fqdn("web01", std::nullopt), "domain absent");
    assert_true(!compose_fqdn("", ""), "never the degenerate \".\"");
    assert_true(!compose_fqdn("  ", "corp"), "blank host");
    assert_true(!compose_fqdn("web01", " "), "blank domain");
    assert_true(compose_fqdn(" web01 ", " corp ") ==
                    std::optional<std::string>("web01.corp"),
                "parts trimmed");
}

static void test_identity_from_dns_name()
{
    IdentityRecord id = identity_from_dns_name("web01", "web01.corp.example.com");
    assert_true(id.name == std::optional<std::string>("web01"), "name = host part");
    assert_true(id.dns_host_name == std::optional<std::string>("web01"), "label");
    assert_true(id.domain == std::optional<std::string>("corp.example.com"),
                "one label stripped");

    id = identity_from_dns_name("10.0.0.5", "db01.lab.local.");
    assert_true(id.name == std::optional<std::string>("10.0.0.5"), "ip name kept");
    assert_true(id.dns_host_name == std::optional<std::string>("db01"), "ptr label");
    assert_true(id.domain == std::optional<std::string>("lab.local"),
                "trailing root dot dropped");

    id = identity_from_dns_name("printer", "printer");
    assert_true(id.dns_host_name == std::optional<std::string>("printer"),
                "unqualified label");
    assert_true(!id.domain, "no domain for an unqualified name");

    id = identity_from_dns_name("x", "");
    assert_true(id.name == std::optional<std::string>("x") && !id.dns_host_name &&
                    !id.domain, "empty full name");
}

static void test_identity_from_system_info()
{
    ComputerSystemInfo info;
    info.caption = "SQL2016";
    info.dns_host_name = "sql2016";
    info.domain = "  ";
    IdentityRecord id = identity_from_system_info(info);
    assert_true(id.name == std::optional<std::string>("SQL2016"),
                "caption used when Name is missing");
    assert_true(!id.domain, "blank domain is absent");

    info.name = "SQL2016-N";
    id = identity_from_system_info(info);
    assert_true(id.name == std::optional<std::string>("SQL2016-N"), "Name wins");
}

static void test_system_info_padding_keeps_fqdn_invariant()
{
    ComputerSystemInfo info;
    info.name = " SQL2016";
    info.dns_host_name = "sql2016 ";
    info.domain = "corp.local\t";
    const IdentityRecord id = identity_from_system_info(info);
    const ResolvedHost h = normalize(make_host_query("sql2016"), ReachabilityResult{}, id);
    assert_true(h.computer_name == std::optional<std::string>("SQL2016"), "name trimmed");
    assert_true(h.dns_host_name == std::optional<std::string>("sql2016"), "dns name trimmed");
    assert_true(h.domain == std::optional<std::string>("corp.local"), "domain trimmed");
    assert_true(h.fqdn && *h.fqdn == *h.dns_host_name + "." + *h.domain,
                "fqdn equals the stored parts joined");
}

static void test_normalize_passthrough()
{
    HostQuery q = make_host_query("sql2016\\sqlexpress");
    ReachabilityResult reach{};
    reach.reached = true;
    reach.ip_address = "10.1.2.3";
    IdentityRecord id;
    id.name = "SQL2016";
    id.dns_host_name = "sql2016";
    id.domain = "corp.example.com";

    ResolvedHost h = normalize(q, reach, id);
    assert_true(h.input_name == "sql2016\\sqlexpress", "input name verbatim");
    assert_true(h.computer_name == id.name, "computer name");
    assert_true(h.ip_address == reach.ip_address, "ip address");
    assert_true(h.fqdn == std::optional<std::string>("sql2016.corp.example.com"),
                "fqdn");
}

static void test_normalize_empty_identity()
{
    HostQuery q = make_host_query("ghost");
    ResolvedHost h = normalize(q, ReachabilityResult{}, IdentityRecord{});
    assert_true(h.input_name == "ghost", "input name set");
    assert_true(!h.computer_name && !h.ip_address && !h.dns_host_name &&
                    !h.domain && !h.fqdn, "everything else absent");

    IdentityRecord partial;
    partial.dns_host_name = "";
    partial.domain = "";
    h = normalize(q, ReachabilityResult{}, partial);
    assert_true(!h.fqdn, "empty parts never produce \".\"");
}

int main()
{
    test_compose_fqdn();
    test_identity_from_dns_name();
    test_identity_from_system_info();
    test_system_info_padding_keeps_fqdn_invariant();
    test_normalize_passthrough();
    test_normalize_empty_identity();

    std::cout << "normalize tests: OK" << std::endl;
    return 0;
}
