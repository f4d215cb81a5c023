#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "hid/transport.hpp"

namespace hid
{
struct LocalIdentity
{
    std::string node_name; // uname().nodename
    std::string short_name;
    std::string fqdn;      // canonical name, may equal short_name
};

// Reads the identity of the running machine.
LocalIdentity read_local_identity();

// ".", "localhost", loopback, the local host name / FQDN or an address bound to
// a local interface.
bool is_local_target(std::string_view host, const LocalIdentity &self);

ComputerSystemInfo system_info_from_local(const LocalIdentity &self);

// Management session that can only reach the local machine; every remote
// target reports NotAvailable.
class LocalSessionTransport final : public ManagementTransport
{
public:
    explicit LocalSessionTransport(ManagementProtocol protocol);

    ManagementProtocol protocol() const override { return protocol_; }
    SessionOpen open_session(const std::string &host,
                             const std::optional<Credential> &credential,
                             int timeout_ms) override;

private:
    ManagementProtocol protocol_;
};
} // namespace hid
