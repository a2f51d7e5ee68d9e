#include "cli/common.hpp"
#include "gitemu/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  try {
    namespace fs = std::filesystem;
    const fs::path root = argc >= 2 ? fs::absolute(argv[1]) : fs::current_path();
    fs::create_directories(root);
    // identity is left to `gitemu config`; commits fall back to the defaults
    const gitemu::Repository repo{root};
    repo.init();
    std::cout << "Initialized empty gitemu repository in "
              << repo.git_dir().lexically_normal().string() << "/\n";
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("init", e);
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
