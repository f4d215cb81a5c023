#include "hid/model.hpp"
#include "hid/transport.hpp"

namespace hid
{
const char *failure_str(const FailureKind kind)
{
    switch (kind)
    {
        case FailureKind::None: return "ok";
        case FailureKind::NotAvailable: return "not_available";
        case FailureKind::ConnectFailed: return "connect_failed";
        case FailureKind::AuthFailed: return "auth_failed";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::NotFound: return "not_found";
        case FailureKind::QueryFailed: return "query_failed";
        case FailureKind::Cancelled: return "cancelled";
        case FailureKind::Exception: return "exception";
    }
    return "unknown";
}

const char *protocol_str(const ManagementProtocol p)
{
    switch (p)
    {
        case ManagementProtocol::WSMan: return "wsman";
        case ManagementProtocol::Dcom: return "dcom";
    }
    return "unknown";
}
} // namespace hid
