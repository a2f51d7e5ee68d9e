#include "cli/common.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/status.hpp"
#include "gitemu/util.hpp"

#include <iostream>

using gitemu::ChangeKind;

namespace {

const char *label(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:    return "new file:   ";
  case ChangeKind::Modified: return "modified:   ";
  case ChangeKind::Deleted:  return "deleted:    ";
  }
  return "";
}

void print_changes(const char *header, const char *hint, const std::vector<gitemu::Change> &xs) {
  if (xs.empty())
    return;
  std::cout << "\n" << header << "\n  " << hint << "\n\n";
  for (const auto &[kind, path] : xs) {
    std::cout << "        " << label(kind) << path << "\n";
  }
}

} // namespace

int cmd_status(int /*argc*/, char ** /*argv*/) {
  try {
    const auto repo = gitemu::cli::open_repository();
    const auto st = repo.status();

    if (st.head.detached) {
      std::cout << "HEAD detached at " << gitemu::short_hex(st.head.oid) << "\n";
    } else {
      std::cout << "On branch " << st.head.branch << "\n";
    }
    if (!st.has_commits) {
      std::cout << "\nNo commits yet\n";
    }

    print_changes("Changes to be committed:", "(stage more with \"gitemu add <file>...\")",
                  st.staged);
    print_changes("Changes not staged for commit:",
                  "(use \"gitemu add <file>...\" to update what will be committed)", st.unstaged);

    if (!st.untracked.empty()) {
      std::cout << "\nUntracked files:\n"
                << "  (use \"gitemu add <file>...\" to include in what will be committed)\n\n";
      for (const auto &p : st.untracked)
        std::cout << "        " << p << "\n";
    }

    if (st.clean()) {
      std::cout << "\nnothing to commit, working tree clean\n";
    }
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("status", e);
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
