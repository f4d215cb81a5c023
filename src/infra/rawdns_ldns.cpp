#include "hid/rawdns.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <sys/time.h>

#include <ldns/ldns.h>

#include "hid/query.hpp"

namespace hid
{
namespace
{
struct ResolverFree { void operator()(ldns_resolver *r) const { ldns_resolver_deep_free(r); } };
struct RdfFree { void operator()(ldns_rdf *r) const { ldns_rdf_deep_free(r); } };
struct PktFree { void operator()(ldns_pkt *p) const { ldns_pkt_free(p); } };
struct RrListFree { void operator()(ldns_rr_list *l) const { ldns_rr_list_deep_free(l); } };

using ResolverPtr = std::unique_ptr<ldns_resolver, ResolverFree>;
using RdfPtr = std::unique_ptr<ldns_rdf, RdfFree>;
using PktPtr = std::unique_ptr<ldns_pkt, PktFree>;
using RrListPtr = std::unique_ptr<ldns_rr_list, RrListFree>;

// owner / rdata text without the trailing root dot
std::string rdf_text(const ldns_rdf *rdf)
{
    std::string out;
    if (!rdf) return out;
    if (char *s = ldns_rdf2str(rdf))
    {
        out = s;
        LDNS_FREE(s);
    }
    if (!out.empty() && out.back() == '.') out.pop_back();
    return out;
}

FailureKind failure_from_status(ldns_status st)
{
    switch (st)
    {
        case LDNS_STATUS_OK: return FailureKind::None;
        case LDNS_STATUS_NETWORK_ERR: return FailureKind::Timeout;
        case LDNS_STATUS_RES_NO_NS: return FailureKind::NotAvailable;
        default: return FailureKind::QueryFailed;
    }
}

ResolverPtr make_resolver(const RawDnsConfig &cfg, int timeout_ms, HostEntry &out)
{
    ldns_resolver *raw = nullptr;
    ldns_status st = LDNS_STATUS_OK;

    if (cfg.ns.empty())
    {
        st = ldns_resolver_new_frm_file(&raw, nullptr);
    }
    else
    {
        raw = ldns_resolver_new();
        if (raw)
        {
            RdfPtr ns_rdf(ldns_rdf_new_frm_str(
                cfg.ns.find(':') != std::string::npos
                    ? LDNS_RDF_TYPE_AAAA
                    : LDNS_RDF_TYPE_A,
                cfg.ns.c_str()));
            if (ns_rdf)
                st = ldns_resolver_push_nameserver(raw, ns_rdf.get());
            else
                st = LDNS_STATUS_SYNTAX_RDATA_ERR;
        }
        else
        {
            st = LDNS_STATUS_MEM_ERR;
        }
    }

    ResolverPtr res(raw);
    if (st != LDNS_STATUS_OK || !res)
    {
        out.kind = FailureKind::NotAvailable;
        out.error = std::string("ldns_resolver init failed: ") +
                    ldns_get_errorstr_by_id(st);
        return nullptr;
    }

    ldns_resolver_set_recursive(res.get(), cfg.rd);
    ldns_resolver_set_usevc(res.get(), cfg.tcp);
    ldns_resolver_set_fallback(res.get(), true);
    ldns_resolver_set_retry(res.get(), 1);
    if (timeout_ms >= 0)
    {
        struct timeval tv{
            .tv_sec = timeout_ms / 1000,
            .tv_usec = (timeout_ms % 1000) * 1000
        };
        ldns_resolver_set_timeout(res.get(), tv);
    }
    return res;
}

// Sends one query and checks transport status and rcode.
PktPtr run_query(ldns_resolver *res, const ldns_rdf *name, ldns_rr_type type,
                 bool search, const RawDnsConfig &cfg, HostEntry &out)
{
    ldns_pkt *raw = nullptr;
    const uint16_t flags = cfg.rd ? LDNS_RD : 0;
    ldns_status st = search
                         ? ldns_resolver_search_status(
                             &raw, res, name, type, LDNS_RR_CLASS_IN, flags)
                         : ldns_resolver_query_status(
                             &raw, res, name, type, LDNS_RR_CLASS_IN, flags);
    PktPtr pkt(raw);
    if (st != LDNS_STATUS_OK || !pkt)
    {
        out.kind = st == LDNS_STATUS_OK ? FailureKind::QueryFailed
                                        : failure_from_status(st);
        out.error = std::string("ldns query failed: ") + ldns_get_errorstr_by_id(st);
        return nullptr;
    }
    if (ldns_pkt_get_rcode(pkt.get()) == LDNS_RCODE_NXDOMAIN)
    {
        out.kind = FailureKind::NotFound;
        out.error = "NXDOMAIN";
        return nullptr;
    }
    if (ldns_pkt_get_rcode(pkt.get()) != LDNS_RCODE_NOERROR)
    {
        out.kind = FailureKind::QueryFailed;
        out.error = "rcode " + std::to_string(static_cast<int>(
                        ldns_pkt_get_rcode(pkt.get())));
        return nullptr;
    }
    return pkt;
}

void lookup_address(ldns_resolver *res, const std::string &ip,
                    const RawDnsConfig &cfg, HostEntry &out)
{
    out.addresses.push_back(ip);
    RdfPtr addr(ldns_rdf_new_frm_str(
        is_ipv4_literal(ip) ? LDNS_RDF_TYPE_A : LDNS_RDF_TYPE_AAAA, ip.c_str()));
    if (!addr)
    {
        out.kind = FailureKind::QueryFailed;
        out.error = "cannot parse address " + ip;
        return;
    }
    RdfPtr rev(ldns_rdf_address_reverse(addr.get()));
    if (!rev)
    {
        out.kind = FailureKind::QueryFailed;
        out.error = "cannot build reverse name for " + ip;
        return;
    }

    PktPtr pkt = run_query(res, rev.get(), LDNS_RR_TYPE_PTR, false, cfg, out);
    if (!pkt) return;

    RrListPtr ptrs(ldns_pkt_rr_list_by_type(pkt.get(), LDNS_RR_TYPE_PTR,
                                            LDNS_SECTION_ANSWER));
    if (!ptrs || ldns_rr_list_rr_count(ptrs.get()) == 0)
    {
        out.kind = FailureKind::NotFound;
        out.error = "no PTR record for " + ip;
        return;
    }
    out.host_name = rdf_text(ldns_rr_rdf(ldns_rr_list_rr(ptrs.get(), 0), 0));
    for (size_t i = 1; i < ldns_rr_list_rr_count(ptrs.get()); ++i)
        out.aliases.push_back(rdf_text(ldns_rr_rdf(ldns_rr_list_rr(ptrs.get(), i), 0)));
}

void lookup_name(ldns_resolver *res, const std::string &host,
                 const RawDnsConfig &cfg, HostEntry &out)
{
    RdfPtr name(ldns_dname_new_frm_str(host.c_str()));
    if (!name)
    {
        out.kind = FailureKind::QueryFailed;
        out.error = "invalid qname " + host;
        return;
    }

    PktPtr pkt = run_query(res, name.get(), LDNS_RR_TYPE_A, true, cfg, out);
    if (!pkt) return;

    RrListPtr cnames(ldns_pkt_rr_list_by_type(pkt.get(), LDNS_RR_TYPE_CNAME,
                                              LDNS_SECTION_ANSWER));
    if (cnames)
    {
        for (size_t i = 0; i < ldns_rr_list_rr_count(cnames.get()); ++i)
            out.aliases.push_back(rdf_text(ldns_rr_owner(ldns_rr_list_rr(cnames.get(), i))));
    }

    RrListPtr addrs(ldns_pkt_rr_list_by_type(pkt.get(), LDNS_RR_TYPE_A,
                                             LDNS_SECTION_ANSWER));
    if (!addrs || ldns_rr_list_rr_count(addrs.get()) == 0)
    {
        out.kind = FailureKind::NotFound;
        out.error = "no address record for " + host;
        return;
    }
    out.host_name = rdf_text(ldns_rr_owner(ldns_rr_list_rr(addrs.get(), 0)));
    for (size_t i = 0; i < ldns_rr_list_rr_count(addrs.get()); ++i)
        out.addresses.push_back(rdf_text(ldns_rr_rdf(ldns_rr_list_rr(addrs.get(), i), 0)));
}
} // namespace

LdnsHostLookup::LdnsHostLookup(RawDnsConfig cfg) : cfg_(std::move(cfg))
{
}

HostEntry LdnsHostLookup::lookup(const std::string &host, int timeout_ms)
{
    HostEntry out{};
    ResolverPtr res = make_resolver(cfg_, timeout_ms, out);
    if (!res) return out;

    if (is_ip_literal(host))
        lookup_address(res.get(), host, cfg_, out);
    else
        lookup_name(res.get(), host, cfg_, out);
    return out;
}
} // namespace hid
