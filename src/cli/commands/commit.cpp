#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/config.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/util.hpp"

#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // very small parser: gitemu commit -m "msg"
  std::string message;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    }
  }
  if (message.empty()) {
    return gitemu::cli::usage_error("commit");
  }

  try {
    const auto repo = gitemu::cli::open_repository();
    // configuration is read once here and handed to the core
    const gitemu::Identity author = gitemu::resolve_identity(repo.load_config());
    const auto staged_count = repo.status().staged.size();

    const std::string oid = repo.commit(message, author);

    const auto head = repo.current();
    const std::string where = head.detached ? "detached HEAD" : head.branch;
    std::cout << "[" << where << " " << gitemu::short_hex(oid) << "] " << message << "\n";
    std::cout << " " << staged_count << (staged_count == 1 ? " file" : " files") << " changed\n";
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("commit", e);
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
