#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <string>

namespace gitemu::cli {

namespace {

std::map<std::string, Command, std::less<>> &table() {
  static std::map<std::string, Command, std::less<>> t;
  return t;
}

} // namespace

void register_command(const Command &cmd) { table().insert_or_assign(std::string(cmd.name), cmd); }

const Command *find_command(std::string_view name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &os) {
  std::size_t width = 0;
  for (const auto &[name, _] : table())
    width = std::max(width, name.size());

  os << "usage: gitemu <command> [<args>]\n\ncommands:\n";
  for (const auto &[name, cmd] : table()) {
    os << "  " << name << std::string(width - name.size() + 2, ' ') << cmd.summary << "\n";
  }
  os << "\nSee 'gitemu help <command>' for the arguments of a command.\n";
}

int usage_error(std::string_view name) {
  if (const auto *cmd = find_command(name)) {
    std::cerr << "usage: gitemu " << cmd->name << (cmd->synopsis.empty() ? "" : " ")
              << cmd->synopsis << "\n";
  } else {
    print_usage(std::cerr);
  }
  return 2;
}

} // namespace gitemu::cli
