#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hid/concurrency.hpp"
#include "hid/identity.hpp"
#include "hid/model.hpp"
#include "hid/transport.hpp"

namespace hid {

// One echo; any failure (or exception) yields reached == false.
ReachabilityResult probe_reachability(EchoTransport& echo,
                                      const std::string& host_part,
                                      int timeout_ms);

// per-item callback, invoked from worker threads as each input completes
using ItemCallback = std::function<void(size_t /*index (0-based)*/,
                                        const ResolveItem&)>;

class HostResolver {
public:
    HostResolver(EchoTransport& echo, const IdentityResolver& identity,
                 ResolverConfig config = {});

    // Throws InvalidHostError for empty or malformed input, nothing else.
    ResolvedHost resolve(std::string_view input,
                         const std::optional<Credential>& credential) const;

    Resolution resolve_traced(std::string_view input,
                              const std::optional<Credential>& credential,
                              const Cancellation* cancel = nullptr) const;

    // One item per input, in input order. A rejected or cancelled input
    // never affects the others.
    std::vector<ResolveItem> resolve_all(const std::vector<std::string>& inputs,
                                         const std::optional<Credential>& credential,
                                         int concurrency,
                                         const ItemCallback& on_item = {},
                                         Cancellation* cancel = nullptr) const;

    const ResolverConfig& config() const { return config_; }

private:
    EchoTransport&          echo_;
    const IdentityResolver& identity_;
    ResolverConfig          config_;
};

} // namespace hid
