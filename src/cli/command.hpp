#pragma once
#include <string_view>

namespace gitemu::cli {

// Handler receives argv starting at the subcommand name; returns the exit code.
using command_fn = int (*)(int argc, char **argv);

struct Command {
  std::string_view name;
  command_fn run;
  std::string_view synopsis; // argument syntax after the command name
  std::string_view summary;
};

} // namespace gitemu::cli
