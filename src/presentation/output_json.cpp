#include "hid/output.hpp"

#include <sstream>
#include <iomanip>

#include "hid/model.hpp"
#include "hid/json.hpp"

namespace hid
{
static const char *status_str(ItemStatus s)
{
    switch (s)
    {
        case ItemStatus::Ok: return "ok";
        case ItemStatus::InvalidInput: return "invalid_input";
        case ItemStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

static void write_item(std::ostringstream &os,
                       const ResolveItem &item,
                       bool with_attempts,
                       const size_t *index = nullptr)
{
    const ResolvedHost &h = item.host;
    os << "{";
    if (index) os << R"("index":)" << *index << ",";
    os << R"("input_name":")" << json_escape(h.input_name) << R"(")";
    os << R"(,"computer_name":)" << json_string_or_null(h.computer_name)
            << R"(,"ip_address":)" << json_string_or_null(h.ip_address)
            << R"(,"dns_host_name":)" << json_string_or_null(h.dns_host_name)
            << R"(,"domain":)" << json_string_or_null(h.domain)
            << R"(,"fqdn":)" << json_string_or_null(h.fqdn);
    if (item.status != ItemStatus::Ok)
    {
        os << R"(,"status":")" << status_str(item.status) << R"(")";
        os << R"(,"error":")" << json_escape(item.error) << R"(")";
    }
    if (with_attempts)
    {
        os << R"(,"ms":)" << item.ms;
        os << R"(,"attempts":[)";
        for (size_t i = 0; i < item.attempts.size(); ++i)
        {
            const auto &a = item.attempts[i];
            if (i) os << ",";
            os << R"({"strategy":")" << json_escape(a.strategy)
                    << R"(","status":")" << failure_str(a.kind) << R"(")";
            if (!a.ok())
                os << R"(,"error":")" << json_escape(a.error) << R"(")";
            os << R"(,"ms":)" << a.ms << "}";
        }
        os << "]";
    }
    os << "}";
}

std::string build_ndjson_item(size_t index,
                              const ResolveItem &item,
                              bool with_attempts)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    write_item(os, item, with_attempts, &index);
    return os.str();
}

std::string build_final_json(const std::vector<ResolveItem> &items,
                             bool with_attempts)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "[";
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) os << ",";
        write_item(os, items[i], with_attempts);
    }
    os << "]";
    return os.str();
}
} // namespace hid
