#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "hid/model.hpp"

namespace hid
{
// "host.domain" when both parts are present and non-blank, otherwise nullopt.
std::optional<std::string> compose_fqdn(const std::optional<std::string> &host,
                                        const std::optional<std::string> &domain);

// Identity derived from a DNS host entry: name = host_part, dns_host_name = the
// leading label of full_name, domain = full_name without "{label}.".
IdentityRecord identity_from_dns_name(std::string_view host_part,
                                      std::string_view full_name);

ResolvedHost normalize(const HostQuery &query,
                       const ReachabilityResult &reach,
                       const IdentityRecord &id);
} // namespace hid
