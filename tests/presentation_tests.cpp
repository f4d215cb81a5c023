#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "hid/json.hpp"
#include "hid/model.hpp"
#include "hid/options.hpp"
#include "hid/output.hpp"
#include "hid/transport.hpp"

using namespace hid;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static void assert_not_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) != std::string::npos)
    {
        std::cerr << "ASSERT FAILED: unexpected substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static ResolveItem resolved_item()
{
    ResolveItem it;
    it.input = "sql2016\\sqlexpress";
    it.host.input_name = it.input;
    it.host.computer_name = "SQL2016";
    it.host.ip_address = "10.20.30.40";
    it.host.dns_host_name = "sql2016";
    it.host.domain = "corp.example.com";
    it.host.fqdn = "sql2016.corp.example.com";
    it.ms = 12.5;

    StrategyOutcome wsman;
    wsman.strategy = "wsman";
    wsman.kind = FailureKind::ConnectFailed;
    wsman.error = "connection refused";
    wsman.ms = 1.25;
    StrategyOutcome dcom;
    dcom.strategy = "dcom";
    dcom.ms = 3.5;
    it.attempts = {wsman, dcom};
    return it;
}

static void test_format_header_text_basic()
{
    Options opt{};
    opt.timeout_ms = 1500;
    opt.concurrency = 4;
    opt.instrumentation = false;
    opt.user = "CORP\\svc";
    opt.ns = "192.0.2.53";
    opt.tcp = true;

    const std::string s = format_header_text(opt, 3);
    assert_contains(s, "Resolving: 3 host(s)", "count");
    assert_contains(s, "Timeout: 1500 ms", "timeout");
    assert_contains(s, "Concurrency: 4", "concurrency");
    assert_contains(s, "Instrumentation: off", "instrumentation");
    assert_contains(s, "Credential: CORP\\svc", "credential user");
    assert_contains(s, "DNS: ldns ns=192.0.2.53 tcp=on", "ldns backend");

    Options def{};
    const std::string d = format_header_text(def, 1);
    assert_contains(d, "Credential: (default)", "default credential");
    assert_contains(d, "DNS: system", "system backend");
}

static void test_format_item_text()
{
    ResolveItem it = resolved_item();
    const std::string s = format_item_text(it, false);
    assert_contains(s, "Input:        sql2016\\sqlexpress", "input");
    assert_contains(s, "ComputerName: SQL2016", "name");
    assert_contains(s, "IPAddress:    10.20.30.40", "ip");
    assert_contains(s, "FQDN:         sql2016.corp.example.com", "fqdn");
    assert_not_contains(s, "Attempts:", "no trace by default");

    const std::string t = format_item_text(it, true);
    assert_contains(t, "Attempts:", "trace header");
    assert_contains(t, "  - wsman: connect_failed <connection refused>  1.250 ms",
                    "failed attempt line");
    assert_contains(t, "  - dcom: ok  3.500 ms", "winning attempt line");

    ResolveItem empty;
    empty.input = "ghost";
    empty.host.input_name = "ghost";
    const std::string e = format_item_text(empty, false);
    assert_contains(e, "ComputerName: (none)", "absent name");
    assert_contains(e, "FQDN:         (none)", "absent fqdn");
}

static void test_format_item_text_rejected()
{
    ResolveItem it;
    it.input = "bad host";
    it.status = ItemStatus::InvalidInput;
    it.error = "invalid host name 'bad host': unexpected character";
    const std::string s = format_item_text(it, true);
    assert_contains(s, "  error: invalid host name", "error line");
    assert_not_contains(s, "ComputerName:", "no fields for a rejected input");
}

static void test_format_summary_text()
{
    const std::string s = format_summary_text(5, 3, 1, 42.0);
    assert_true(s == "summary: 5 input(s), 3 resolved, 1 rejected in 42.000 ms\n",
                "summary line");
}

static void test_build_final_json()
{
    ResolveItem ok = resolved_item();
    ResolveItem bad;
    bad.input = "\"q\"";
    bad.host.input_name = bad.input;
    bad.status = ItemStatus::InvalidInput;
    bad.error = "rejected";

    const std::string s = build_final_json({ok, bad}, false);
    assert_true(s.front() == '[' && s.back() == ']', "array");
    assert_contains(s, R"("input_name":"sql2016\\sqlexpress")", "escaped backslash");
    assert_contains(s, R"("computer_name":"SQL2016")", "name");
    assert_contains(s, R"("fqdn":"sql2016.corp.example.com")", "fqdn");
    assert_contains(s, R"("input_name":"\"q\"","computer_name":null)", "nulls");
    assert_contains(s, R"("status":"invalid_input","error":"rejected")", "status");
    assert_not_contains(s, R"("attempts")", "no attempts by default");

    const std::string t = build_final_json({ok}, true);
    assert_contains(t, R"("ms":12.500)", "item ms");
    assert_contains(t, R"({"strategy":"wsman","status":"connect_failed","error":"connection refused","ms":1.250})",
                    "failed attempt");
    assert_contains(t, R"({"strategy":"dcom","status":"ok","ms":3.500})", "ok attempt");
}

static void test_build_ndjson_item()
{
    const std::string s = build_ndjson_item(7, resolved_item(), false);
    assert_true(s.rfind(R"({"index":7,"input_name":)", 0) == 0, "index first");
    assert_true(s.find('\n') == std::string::npos, "single line");
}

static void test_json_helpers()
{
    assert_true(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "escape");
    assert_true(json_escape(std::string_view("\x01", 1)) == "\\u0001", "control char");
    assert_true(json_string_or_null(std::nullopt) == "null", "null");
    assert_true(json_string_or_null(std::string("x")) == "\"x\"", "string");
}

static void test_failure_strings()
{
    assert_true(std::string_view(failure_str(FailureKind::None)) == "ok", "ok");
    assert_true(std::string_view(failure_str(FailureKind::NotAvailable)) ==
                    "not_available", "not_available");
    assert_true(std::string_view(failure_str(FailureKind::Exception)) == "exception",
                "exception");
    assert_true(std::string_view(protocol_str(ManagementProtocol::Dcom)) == "dcom",
                "dcom");
}

int main()
{
    test_format_header_text_basic();
    test_format_item_text();
    test_format_item_text_rejected();
    test_format_summary_text();
    test_build_final_json();
    test_build_ndjson_item();
    test_json_helpers();
    test_failure_strings();

    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
