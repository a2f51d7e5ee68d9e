#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/util.hpp"

#include <iostream>
#include <string>

int cmd_branch(int argc, char **argv) {
  try {
    const auto repo = gitemu::cli::open_repository();

    if (argc < 2) {
      for (const auto &b : repo.list_branches()) {
        std::cout << (b.current ? "* " : "  ") << b.name << "\n";
      }
      return 0;
    }

    const std::string flag = argv[1];
    if (flag == "-d" || flag == "--delete") {
      if (argc != 3) {
        return gitemu::cli::usage_error("branch");
      }
      repo.delete_branch(argv[2]);
      std::cout << "Deleted branch " << argv[2] << "\n";
      return 0;
    }
    if (flag == "-m" || flag == "--move") {
      if (argc != 4) {
        return gitemu::cli::usage_error("branch");
      }
      repo.rename_branch(argv[2], argv[3]);
      std::cout << "Branch '" << argv[2] << "' renamed to '" << argv[3] << "'\n";
      return 0;
    }

    repo.create_branch(flag);
    std::cout << "Branch '" << flag << "' created";
    for (const auto &b : repo.list_branches()) {
      if (b.name == flag && b.target) {
        std::cout << " at " << gitemu::short_hex(*b.target);
      }
    }
    std::cout << "\n";
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("branch", e);
  } catch (const std::exception &e) {
    std::cerr << "branch: " << e.what() << "\n";
    return 1;
  }
}
