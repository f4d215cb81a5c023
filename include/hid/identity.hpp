#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hid/concurrency.hpp"
#include "hid/model.hpp"
#include "hid/transport.hpp"

namespace hid
{
// One identity-lookup transport behind a uniform interface.
class IdentityStrategy
{
public:
    virtual ~IdentityStrategy() = default;

    virtual const char *name() const = 0;

    // true for management-instrumentation strategies, which are skipped when
    // the caller reports instrumentation as unavailable.
    virtual bool instrumentation() const = 0;

    virtual StrategyOutcome query(const std::string &host,
                                  const std::optional<Credential> &credential,
                                  int timeout_ms) = 0;
};

// Session-oriented query (WSMan primary, DCOM fallback).
class SessionQueryStrategy final : public IdentityStrategy
{
public:
    explicit SessionQueryStrategy(ManagementTransport &transport);

    const char *name() const override;
    bool instrumentation() const override { return true; }
    StrategyOutcome query(const std::string &host,
                          const std::optional<Credential> &credential,
                          int timeout_ms) override;

private:
    ManagementTransport &transport_;
};

// Legacy object-model query.
class ObjectQueryStrategy final : public IdentityStrategy
{
public:
    explicit ObjectQueryStrategy(ObjectQuery &query);

    const char *name() const override { return "legacy"; }
    bool instrumentation() const override { return true; }
    StrategyOutcome query(const std::string &host,
                          const std::optional<Credential> &credential,
                          int timeout_ms) override;

private:
    ObjectQuery &query_;
};

// Forward DNS fallback; the credential is not used.
class DnsNameStrategy final : public IdentityStrategy
{
public:
    explicit DnsNameStrategy(HostLookup &lookup);

    const char *name() const override { return "dns"; }
    bool instrumentation() const override { return false; }
    StrategyOutcome query(const std::string &host,
                          const std::optional<Credential> &credential,
                          int timeout_ms) override;

private:
    HostLookup &lookup_;
};

// Maps the instrumentation field set into an IdentityRecord.
IdentityRecord identity_from_system_info(const ComputerSystemInfo &info);

struct ResolverConfig
{
    bool instrumentation_available = true;
    int  timeout_ms = 2000; // per transport call
};

class IdentityResolver
{
public:
    IdentityResolver() = default;
    explicit IdentityResolver(std::vector<std::unique_ptr<IdentityStrategy>> chain);

    void add(std::unique_ptr<IdentityStrategy> strategy);
    size_t size() const { return chain_.size(); }

    // Tries the chain in order, first success wins. Never throws for
    // transport reasons; an all-failed chain yields an empty record.
    IdentityRecord resolve(const std::string &host_part,
                           const std::optional<Credential> &credential,
                           const ResolverConfig &config,
                           std::vector<StrategyOutcome> *trace = nullptr,
                           const Cancellation *cancel = nullptr) const;

private:
    std::vector<std::unique_ptr<IdentityStrategy>> chain_;
};
} // namespace hid
