#include "hid/usecases.hpp"

#include <exception>

#include "hid/log.hpp"
#include "hid/query.hpp"

namespace hid {

ReachabilityResult probe_reachability(EchoTransport& echo,
                                      const std::string& host_part,
                                      int timeout_ms)
{
    ReachabilityResult r{};
    EchoReply reply{};
    try
    {
        reply = echo.echo(host_part, timeout_ms);
    }
    catch (const std::exception& e)
    {
        reply.kind  = FailureKind::Exception;
        reply.error = e.what();
    }
    catch (...)
    {
        reply.kind  = FailureKind::Exception;
        reply.error = "unknown exception";
    }

    if (reply.kind == FailureKind::None && !is_ipv4_literal(reply.address))
    {
        reply.kind  = FailureKind::QueryFailed;
        reply.error = "echo reply without an IPv4 address";
    }

    if (reply.kind == FailureKind::None)
    {
        r.reached    = true;
        r.ip_address = reply.address;
        log_debug("{}: echo reply from {} in {:.3f} ms",
                  host_part, reply.address, reply.ms);
    }
    else
    {
        log_debug("{}: no echo reply ({}): {}",
                  host_part, failure_str(reply.kind), reply.error);
    }
    return r;
}

} // namespace hid
