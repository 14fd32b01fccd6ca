#pragma once

#include "wsp/options.hpp"

namespace wsp {

void print_usage(const char *prog);

// false on unknown options or malformed values (message already printed)
bool parse_args(int argc, char **argv, Options &opt);

} // namespace wsp
