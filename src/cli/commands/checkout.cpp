#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/util.hpp"

#include <iostream>
#include <string>

int cmd_checkout(int argc, char **argv) {
  if (argc < 2) {
    return gitemu::cli::usage_error("checkout");
  }
  try {
    const auto repo = gitemu::cli::open_repository();
    repo.checkout(argv[1]);
    if (const auto head = repo.current(); head.detached) {
      std::cout << "HEAD is now at " << gitemu::short_hex(head.oid) << "\n";
    } else {
      std::cout << "Switched to branch '" << head.branch << "'\n";
    }
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("checkout", e);
  } catch (const std::exception &e) {
    std::cerr << "checkout: " << e.what() << "\n";
    return 1;
  }
}
