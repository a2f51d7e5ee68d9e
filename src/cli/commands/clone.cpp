#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/config.hpp"
#include "gitemu/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

// The archive itself is fetched and unpacked by an outside tool; this only
// turns the unpacked directory into a repository with one commit.
int cmd_clone(int argc, char **argv) {
  if (argc < 2) {
    return gitemu::cli::usage_error("clone");
  }
  try {
    fs::path src = fs::absolute(argv[1]).lexically_normal();
    if (!src.has_filename()) {
      src = src.parent_path();
    }
    const fs::path dest = argc >= 3 ? fs::path(argv[2]) : fs::current_path() / src.filename();

    std::cout << "Cloning into '" << dest.filename().string() << "'...\n";
    // no repository exists yet to hold config, so the defaults sign the import
    const auto repo = gitemu::import_tree(src, dest, gitemu::resolve_identity(gitemu::Config{}));
    const auto count = repo.log().size();
    std::cout << "Imported " << src.string() << " into " << fs::absolute(dest).string() << " ("
              << count << (count == 1 ? " commit" : " commits") << ")\n";
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("clone", e);
  } catch (const std::exception &e) {
    std::cerr << "clone: " << e.what() << "\n";
    return 1;
  }
}
