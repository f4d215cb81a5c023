#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hid/model.hpp"

namespace hid
{
// Collaborator interfaces consumed by the prober and the strategy adapters.
// Implementations report failures through `kind`/`error`; they should not throw,
// but the resolver isolates anything that escapes.

struct EchoReply
{
    FailureKind kind{FailureKind::None};
    std::string error;
    std::string address; // responder, IPv4 dotted quad
    double      ms{};
};

class EchoTransport
{
public:
    virtual ~EchoTransport() = default;
    virtual EchoReply echo(const std::string &host, int timeout_ms) = 0;
};

// The four Win32_ComputerSystem-style fields queried by instrumentation.
struct ComputerSystemInfo
{
    std::optional<std::string> name;
    std::optional<std::string> caption;
    std::optional<std::string> dns_host_name;
    std::optional<std::string> domain;
};

struct SystemQueryReply
{
    FailureKind        kind{FailureKind::None};
    std::string        error;
    ComputerSystemInfo info;
};

// An open management session. Destruction closes it.
class ManagementSession
{
public:
    virtual ~ManagementSession() = default;
    virtual SystemQueryReply query_computer_system(int timeout_ms) = 0;
};

enum class ManagementProtocol { WSMan, Dcom };

const char *protocol_str(ManagementProtocol p);

struct SessionOpen
{
    FailureKind                        kind{FailureKind::None};
    std::string                        error;
    std::unique_ptr<ManagementSession> session; // non-null iff kind == None
};

class ManagementTransport
{
public:
    virtual ~ManagementTransport() = default;
    virtual ManagementProtocol protocol() const = 0;
    virtual SessionOpen open_session(const std::string &host,
                                     const std::optional<Credential> &credential,
                                     int timeout_ms) = 0;
};

// Legacy object-model query; no session concept.
class ObjectQuery
{
public:
    virtual ~ObjectQuery() = default;
    virtual SystemQueryReply query_computer_system(
        const std::string &host,
        const std::optional<Credential> &credential,
        int timeout_ms) = 0;
};

struct HostEntry
{
    FailureKind              kind{FailureKind::None};
    std::string              error;
    std::string              host_name; // canonical name, may be unqualified
    std::vector<std::string> aliases;
    std::vector<std::string> addresses;
};

class HostLookup
{
public:
    virtual ~HostLookup() = default;
    virtual HostEntry lookup(const std::string &host, int timeout_ms) = 0;
};
} // namespace hid
