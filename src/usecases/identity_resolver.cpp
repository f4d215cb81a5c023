#include "hid/identity.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include "hid/log.hpp"

namespace hid
{
namespace
{
StrategyOutcome skipped(const IdentityStrategy &s, FailureKind kind,
                        const char *why)
{
    StrategyOutcome out{};
    out.strategy = s.name();
    out.kind = kind;
    out.error = why;
    return out;
}

// A strategy must never abort the chain, whatever its transport does.
StrategyOutcome run_isolated(IdentityStrategy &s,
                             const std::string &host,
                             const std::optional<Credential> &credential,
                             int timeout_ms)
{
    auto t0 = std::chrono::steady_clock::now();
    auto thrown = [&](std::string what)
    {
        StrategyOutcome out{};
        out.strategy = s.name();
        out.kind = FailureKind::Exception;
        out.error = std::move(what);
        auto t1 = std::chrono::steady_clock::now();
        out.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        return out;
    };
    try
    {
        return s.query(host, credential, timeout_ms);
    }
    catch (const std::exception &e)
    {
        return thrown(e.what());
    }
    catch (...)
    {
        return thrown("unknown exception");
    }
}
} // namespace

IdentityResolver::IdentityResolver(
    std::vector<std::unique_ptr<IdentityStrategy>> chain)
    : chain_(std::move(chain))
{
}

void IdentityResolver::add(std::unique_ptr<IdentityStrategy> strategy)
{
    if (strategy) chain_.push_back(std::move(strategy));
}

IdentityRecord IdentityResolver::resolve(
    const std::string &host_part,
    const std::optional<Credential> &credential,
    const ResolverConfig &config,
    std::vector<StrategyOutcome> *trace,
    const Cancellation *cancel) const
{
    auto record = [&](StrategyOutcome o)
    {
        if (trace) trace->push_back(std::move(o));
    };

    bool cancelled = false;
    for (const auto &s: chain_)
    {
        if (!cancelled && cancel && cancel->is_cancelled())
        {
            log_debug("{}: resolution cancelled before strategy {}",
                      host_part, s->name());
            cancelled = true;
        }
        if (cancelled)
        {
            record(skipped(*s, FailureKind::Cancelled, "resolution cancelled"));
            continue;
        }
        if (s->instrumentation() && !config.instrumentation_available)
        {
            log_trace("{}: strategy {} skipped, instrumentation unavailable",
                      host_part, s->name());
            record(skipped(*s, FailureKind::NotAvailable,
                           "instrumentation unavailable"));
            continue;
        }

        StrategyOutcome o = run_isolated(*s, host_part, credential,
                                         config.timeout_ms);
        if (o.ok())
        {
            log_debug("{}: strategy {} succeeded in {:.3f} ms",
                      host_part, o.strategy, o.ms);
            IdentityRecord id = o.record;
            record(std::move(o));
            return id;
        }
        log_debug("{}: strategy {} failed ({}): {}",
                  host_part, o.strategy, failure_str(o.kind), o.error);
        record(std::move(o));
    }

    log_debug("{}: identity unknown, no strategy succeeded", host_part);
    return {};
}
} // namespace hid
