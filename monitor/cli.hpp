#pragma once
#include <ostream>
#include <string>
#include "../common/config.hpp"

namespace battlog {

enum class CliAction { RUN, HELP, FAIL };

// Fills `S` from an optional -c/--config JSON file and then from the
// remaining flags, which take precedence. On FAIL `err` says why.
CliAction parse_args(int argc, const char* const* argv, Settings& S, std::string& err);

void print_usage(std::ostream& os, const std::string& prog);

} // namespace battlog
