#include "gitemu/status.hpp"

#include "gitemu/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static bool has_change(const std::vector<gitemu::Change> &xs, gitemu::ChangeKind k,
                       std::string_view path) {
  for (auto &c : xs)
    if (c.kind == k && c.path == path)
      return true;
  return false;
}

static bool has_path(const std::vector<std::string> &xs, std::string_view path) {
  for (auto &x : xs)
    if (x == path)
      return true;
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitemu_status_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const gitemu::Identity me{.name = "User", .email = "u@example.com"};
    gitemu::Repository repo{root};
    repo.init(me);

    // 1) Untracked before staging
    write_file(root / "a.txt", "hello\n");
    {
      auto st = repo.status();
      if (st.untracked != std::vector<std::string>{"a.txt"} || !st.staged.empty()) {
        std::cerr << "expected a.txt untracked only (initial)\n";
        return 1;
      }
    }

    // 2) Stage it; no commit yet => staged Added
    (void)repo.add({"a.txt"});
    {
      auto st = repo.status();
      if (!has_change(st.staged, gitemu::ChangeKind::Added, "a.txt")) {
        std::cerr << "expected staged Added a.txt (initial)\n";
        return 1;
      }
      if (!st.unstaged.empty() || !st.untracked.empty() || st.has_commits) {
        std::cerr << "unexpected unstaged/untracked changes (initial)\n";
        return 1;
      }
    }

    // 3) Commit => clean
    (void)repo.commit("first", me);
    {
      auto st = repo.status();
      if (!st.clean() || !st.has_commits || st.head.branch != "main") {
        std::cerr << "expected clean status after commit\n";
        return 1;
      }
    }

    // 4) Modify the working file without staging => unstaged Modified
    write_file(root / "a.txt", "hello world\n");
    {
      auto st = repo.status();
      if (!has_change(st.unstaged, gitemu::ChangeKind::Modified, "a.txt") || !st.staged.empty()) {
        std::cerr << "expected unstaged Modified a.txt\n";
        return 1;
      }
    }

    // 5) Stage the modification => staged Modified, not also unstaged
    (void)repo.add({"a.txt"});
    {
      auto st = repo.status();
      if (!has_change(st.staged, gitemu::ChangeKind::Modified, "a.txt") || !st.unstaged.empty()) {
        std::cerr << "expected staged Modified a.txt only\n";
        return 1;
      }
    }

    // 6) Revert the file and re-add: the entry drops out of the index
    write_file(root / "a.txt", "hello\n");
    (void)repo.add({"a.txt"});
    if (!repo.status().clean()) {
      std::cerr << "reverting to committed content did not leave status clean\n";
      return 1;
    }

    // 7) Delete the tracked file => unstaged Deleted
    fs::remove(root / "a.txt");
    write_file(root / "sub/new.txt", "n\n");
    {
      auto st = repo.status();
      if (!has_change(st.unstaged, gitemu::ChangeKind::Deleted, "a.txt")) {
        std::cerr << "expected unstaged Deleted a.txt\n";
        return 1;
      }
      if (!has_path(st.untracked, "sub/new.txt")) {
        std::cerr << "expected untracked sub/new.txt\n";
        return 1;
      }
    }

    // Metadata never shows up in any set
    {
      auto st = repo.status();
      for (const auto &p : st.untracked) {
        if (p.starts_with(".gitemu")) {
          std::cerr << "metadata listed as untracked: " << p << "\n";
          return 1;
        }
      }
    }

    std::cout << "status test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
