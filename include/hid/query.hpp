#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "hid/model.hpp"

namespace hid
{
class InvalidHostError : public std::invalid_argument
{
public:
    InvalidHostError(std::string input, const std::string &reason);

    const std::string &input() const { return input_; }

private:
    std::string input_;
};

// Splits "host\instance" and validates the host part.
// Throws InvalidHostError for empty or malformed host names.
HostQuery make_host_query(std::string_view raw);

bool is_ipv4_literal(std::string_view host);
bool is_ipv6_literal(std::string_view host);
bool is_ip_literal(std::string_view host);

std::string_view trim_view(std::string_view s);
} // namespace hid
