#include "hid/json.hpp"

#include <format>
#include <iterator>

namespace hid {

// appends s to out as JSON string content (no surrounding quotes)
static void append_escaped(std::string& out, std::string_view s) {
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        switch (c) {
            case '"':  out += R"(\")"; continue;
            case '\\': out += R"(\\)"; continue;
            case '\n': out += R"(\n)"; continue;
            case '\r': out += R"(\r)"; continue;
            case '\t': out += R"(\t)"; continue;
            case '\b': out += R"(\b)"; continue;
            case '\f': out += R"(\f)"; continue;
            default: break;
        }
        if (uc < 0x20)
            std::format_to(std::back_inserter(out), "\\u{:04x}", uc);
        else
            out += c;
    }
}

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    append_escaped(out, s);
    return out;
}

std::string json_string_or_null(const std::optional<std::string>& s) {
    if (!s) return "null";
    std::string out;
    out.reserve(s->size() + 2);
    out += '"';
    append_escaped(out, *s);
    out += '"';
    return out;
}

} // namespace hid
