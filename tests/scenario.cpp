#include "gitemu/refs.hpp"
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

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitemu_scenario_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const gitemu::Identity me{.name = "User", .email = "u@example.com"};
    gitemu::Repository repo{root};
    repo.init(me);

    // init: no commits, nothing staged, nothing untracked
    {
      const auto st = repo.status();
      if (st.has_commits || !st.staged.empty() || !st.untracked.empty()) {
        std::cerr << "fresh status not empty\n";
        return 1;
      }
    }

    write_file(root / "a.txt", "x");
    if (repo.status().untracked != std::vector<std::string>{"a.txt"}) {
      std::cerr << "a.txt not untracked\n";
      return 1;
    }

    (void)repo.add({"a.txt"});
    {
      const auto st = repo.status();
      if (st.staged.size() != 1 || st.staged[0].path != "a.txt" ||
          st.staged[0].kind != gitemu::ChangeKind::Added || !st.untracked.empty()) {
        std::cerr << "a.txt not staged\n";
        return 1;
      }
    }

    const std::string first = repo.commit("first", me);
    {
      const auto history = repo.log();
      if (history.size() != 1 || history[0].id != first || history[0].info.summary() != "first" ||
          history[0].info.parent) {
        std::cerr << "log after first commit wrong\n";
        return 1;
      }
      if (!repo.status().clean()) {
        std::cerr << "status not clean after commit\n";
        return 1;
      }
    }

    repo.create_branch("feature");
    repo.checkout("feature");
    {
      bool feature_current = false;
      for (const auto &b : repo.list_branches()) {
        if (b.current && b.name != "feature") {
          std::cerr << b.name << " marked current\n";
          return 1;
        }
        feature_current = feature_current || (b.current && b.name == "feature");
      }
      if (!feature_current) {
        std::cerr << "feature not current\n";
        return 1;
      }
    }

    write_file(root / "a.txt", "y");
    (void)repo.add({"a.txt"});
    const std::string second = repo.commit("second", me);

    const gitemu::RefStore refs{repo.git_dir()};
    if (refs.read_branch("feature")->target != second || refs.read_branch("main")->target != first) {
      std::cerr << "commit on feature moved the wrong ref\n";
      return 1;
    }

    std::cout << "scenario OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
