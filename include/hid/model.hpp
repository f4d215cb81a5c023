#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hid
{
// Transport / strategy failure classification. None means success.
enum class FailureKind
{
    None = 0,
    NotAvailable,
    ConnectFailed,
    AuthFailed,
    Timeout,
    NotFound,
    QueryFailed,
    Cancelled,
    Exception,
};

const char *failure_str(FailureKind kind);

struct Credential
{
    std::string user;
    std::string password;
};

struct HostQuery
{
    std::string raw_input;  // verbatim, may carry "\instance"
    std::string host_part;  // the only form handed to transports
};

struct ReachabilityResult
{
    std::optional<std::string> ip_address; // IPv4 dotted quad
    bool reached{};
};

struct IdentityRecord
{
    std::optional<std::string> name;
    std::optional<std::string> dns_host_name;
    std::optional<std::string> domain;

    bool empty() const { return !name && !dns_host_name && !domain; }
};

struct ResolvedHost
{
    std::string input_name;
    std::optional<std::string> computer_name;
    std::optional<std::string> ip_address;
    std::optional<std::string> dns_host_name;
    std::optional<std::string> domain;
    std::optional<std::string> fqdn;
};

struct StrategyOutcome
{
    std::string    strategy;
    FailureKind    kind{FailureKind::None};
    std::string    error;   // valid if kind != None
    IdentityRecord record;  // valid if kind == None
    double         ms{};

    bool ok() const { return kind == FailureKind::None; }
};

struct Resolution
{
    ResolvedHost                 host;
    ReachabilityResult           reach;
    std::vector<StrategyOutcome> attempts;
    double                       ms{};
};

enum class ItemStatus { Ok = 0, InvalidInput, Cancelled };

struct ResolveItem
{
    std::string                  input;
    ItemStatus                   status{ItemStatus::Ok};
    std::string                  error;   // valid if status != Ok
    ResolvedHost                 host;    // input_name is always set
    std::vector<StrategyOutcome> attempts;
    double                       ms{};
};
} // namespace hid
