#include "cli/common.hpp"
#include "gitemu/repo.hpp"

#include <iostream>

int cmd_tag(int argc, char **argv) {
  try {
    const auto repo = gitemu::cli::open_repository();
    if (argc < 2) {
      for (const auto &t : repo.list_tags()) {
        std::cout << t.name << "\n";
      }
      return 0;
    }
    repo.create_tag(argv[1]);
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("tag", e);
  } catch (const std::exception &e) {
    std::cerr << "tag: " << e.what() << "\n";
    return 1;
  }
}
