#pragma once

#include <istream>
#include <string>
#include <vector>

#include "hid/options.hpp"

namespace hid
{
void print_usage(const char *prog);

// false on --help or a usage error (message already printed)
bool parse_args(int argc, char **argv, Options &opt);

// Applies HOSTIDENT_LOG_LEVEL; call before parse_args so flags win.
void apply_environment(Options &opt);

// Non-blank, non-comment lines, trimmed.
std::vector<std::string> read_input_lines(std::istream &in);
} // namespace hid
