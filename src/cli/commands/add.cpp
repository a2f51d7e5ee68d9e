#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/repo.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    return gitemu::cli::usage_error("add");
  }

  try {
    const auto repo = gitemu::cli::open_repository();

    // Collect unique paths while preserving order
    std::vector<std::string> paths;
    paths.reserve(static_cast<std::size_t>(argc) - 1);
    for (int i = 1; i < argc; ++i) {
      auto path = gitemu::cli::to_repo_path(repo, argv[i]);
      if (std::ranges::find(paths, path) == paths.end()) {
        paths.push_back(std::move(path));
      }
    }

    const auto staged = repo.add(paths);
    for (const auto &p : staged) {
      std::cout << "added: " << p << "\n";
    }
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("add", e);
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
