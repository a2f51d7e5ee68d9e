#pragma once
#include "cli/command.hpp"

#include <ostream>
#include <string_view>

namespace gitemu::cli {

// Lookup table from command name to handler. Names are unique; re-registering replaces.
void register_command(const Command &cmd);
[[nodiscard]] const Command *find_command(std::string_view name);

void print_usage(std::ostream &os);
// "usage: gitemu <name> <synopsis>" on stderr; returns the usage exit code (2).
int usage_error(std::string_view name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitemu::cli
