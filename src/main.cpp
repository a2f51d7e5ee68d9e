#include "cli/registry.hpp"

#include <iostream>
#include <string_view>

int main(int argc, char **argv) {
  gitemu::cli::register_all_commands();

  if (argc < 2) {
    gitemu::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string_view name = argv[1];

  if (name == "help" || name == "--help" || name == "-h") {
    if (argc > 2 && gitemu::cli::find_command(argv[2])) {
      const auto *cmd = gitemu::cli::find_command(argv[2]);
      std::cout << "usage: gitemu " << cmd->name << (cmd->synopsis.empty() ? "" : " ")
                << cmd->synopsis << "\n\n"
                << "    " << cmd->summary << "\n";
      return 0;
    }
    gitemu::cli::print_usage(std::cout);
    return 0;
  }

  const auto *cmd = gitemu::cli::find_command(name);
  if (!cmd) {
    std::cerr << "gitemu: '" << name << "' is not a gitemu command. See 'gitemu help'.\n";
    return 2;
  }
  // Pass everything after "gitemu" to the handler
  return cmd->run(argc - 1, argv + 1);
}
