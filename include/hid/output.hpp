#pragma once

#include <string>
#include <vector>

namespace hid
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct ResolveItem;
struct StrategyOutcome;

// Text formatting (returns complete text block with trailing newlines)
std::string format_header_text(const Options &opt, size_t input_count);

std::string format_item_text(const ResolveItem &item, bool with_attempts);

std::string format_attempts_text(const std::vector<StrategyOutcome> &attempts);

std::string format_summary_text(size_t total,
                                size_t resolved,
                                size_t rejected,
                                double elapsed_ms);

// NDJSON builder (single-line JSON string without trailing newline)
std::string build_ndjson_item(size_t index,
                              const ResolveItem &item,
                              bool with_attempts);

// Final JSON (single array string without trailing newline)
std::string build_final_json(const std::vector<ResolveItem> &items,
                             bool with_attempts);
} // namespace hid
