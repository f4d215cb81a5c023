#include "hid/usecases.hpp"

#include <chrono>
#include <utility>

#include "hid/log.hpp"
#include "hid/normalize.hpp"
#include "hid/query.hpp"

namespace hid {

HostResolver::HostResolver(EchoTransport& echo, const IdentityResolver& identity,
                           ResolverConfig config)
    : echo_(echo), identity_(identity), config_(config)
{
}

ResolvedHost HostResolver::resolve(std::string_view input,
                                   const std::optional<Credential>& credential) const
{
    return resolve_traced(input, credential).host;
}

Resolution HostResolver::resolve_traced(std::string_view input,
                                        const std::optional<Credential>& credential,
                                        const Cancellation* cancel) const
{
    auto t0 = std::chrono::steady_clock::now();
    const HostQuery query = make_host_query(input);

    Resolution out{};
    out.reach = probe_reachability(echo_, query.host_part, config_.timeout_ms);

    const IdentityRecord id = identity_.resolve(query.host_part, credential, config_,
                                                &out.attempts, cancel);

    out.host = normalize(query, out.reach, id);
    auto t1 = std::chrono::steady_clock::now();
    out.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    log_info("{}: resolved in {:.3f} ms (fqdn: {})", query.raw_input, out.ms,
             out.host.fqdn.value_or("none"));
    return out;
}

std::vector<ResolveItem> HostResolver::resolve_all(
    const std::vector<std::string>& inputs,
    const std::optional<Credential>& credential,
    int concurrency,
    const ItemCallback& on_item,
    Cancellation* cancel) const
{
    std::vector<ResolveItem> items(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        items[i].input = inputs[i];
        items[i].host.input_name = inputs[i];
    }

    auto do_one = [&](int idx, const std::atomic<bool>&)
    {
        ResolveItem& item = items[idx];
        try
        {
            Resolution r = resolve_traced(inputs[idx], credential, cancel);
            item.host     = std::move(r.host);
            item.attempts = std::move(r.attempts);
            item.ms       = r.ms;
        }
        catch (const InvalidHostError& e)
        {
            item.status = ItemStatus::InvalidInput;
            item.error  = e.what();
            log_warn("{}", e.what());
        }
        if (on_item) on_item(static_cast<size_t>(idx), item);
    };

    auto skipped = [&](int idx)
    {
        ResolveItem& item = items[idx];
        item.status = ItemStatus::Cancelled;
        item.error  = "cancelled before start";
        if (on_item) on_item(static_cast<size_t>(idx), item);
    };

    for_each_index_cancelable(static_cast<int>(inputs.size()), concurrency,
                              do_one, cancel, skipped);
    return items;
}

} // namespace hid
