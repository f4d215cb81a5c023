#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hid {

std::string json_escape(std::string_view s);

// "\"...\"" or null
std::string json_string_or_null(const std::optional<std::string>& s);

} // namespace hid
