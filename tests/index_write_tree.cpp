#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/hash.hpp"
#include "gitemu/index.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/util.hpp"
#include "gitemu/worktree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using gitemu::Index;
using gitemu::oid;
using gitemu::Repository;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  // temp repo
  const auto base = fs::temp_directory_path();
  const fs::path root = base / ("gitemu_idx_tree_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    Repository repo{root};
    repo.init(gitemu::Identity{.name = "T", .email = "t@e"});

    // Working tree files
    write_file(root / "a.txt", "A\n");
    write_file(root / "dir/b.txt", "B\n");
    write_file(root / "dir/sub/c.txt", "C\n");

    // Staging a directory picks up every file beneath it
    const auto staged = repo.add({"a.txt", "dir"});
    if (staged != std::vector<std::string>{"a.txt", "dir/b.txt", "dir/sub/c.txt"}) {
      std::cerr << "unexpected staged set (" << staged.size() << " paths)\n";
      return 1;
    }

    // The index file persists entries sorted by path
    Index idx{repo.git_dir()};
    idx.load();
    if (idx.entries().size() != 3 || idx.entries().front().path != "a.txt" ||
        idx.entries().back().path != "dir/sub/c.txt") {
      std::cerr << "index entries not persisted in order\n";
      return 1;
    }
    const auto a_id = idx.find("a.txt");
    if (!a_id ||
        gitemu::to_hex(*a_id) != gitemu::compute_blob_hex_oid(gitemu::fs::as_bytes("A\n"))) {
      std::cerr << "a.txt not staged with its blob id\n";
      return 1;
    }

    // Re-staging the same path overwrites rather than duplicates
    write_file(root / "a.txt", "A2\n");
    (void)repo.add({"a.txt"});
    idx.load();
    if (idx.entries().size() != 3 || idx.find("a.txt") == a_id) {
      std::cerr << "re-stage did not replace the entry\n";
      return 1;
    }

    // Fold the flat map into nested trees
    const auto flat = idx.as_path_oid_map();
    const std::string root_tree = gitemu::worktree::write_tree_from_map(repo, flat);

    auto entries = repo.read_tree(root_tree);
    bool have_a = false;
    bool have_dir = false;
    oid dir_oid{};
    for (auto &e : entries) {
      if (e.name == "a.txt" && e.mode == gitemu::consts::kModeFile) {
        have_a = true;
      }
      if (e.name == "dir" && e.mode == gitemu::consts::kModeTree) {
        have_dir = true;
        dir_oid = e.id;
      }
    }
    if (entries.size() != 2 || !have_a || !have_dir) {
      std::cerr << "root tree entries missing\n";
      return 1;
    }

    // Verify the "dir" subtree has 'b.txt' and the 'sub' tree
    const auto dir_entries = repo.read_tree(gitemu::to_hex(dir_oid));
    if (dir_entries.size() != 2 || dir_entries[0].name != "b.txt" ||
        dir_entries[0].mode != gitemu::consts::kModeFile || dir_entries[1].name != "sub" ||
        dir_entries[1].mode != gitemu::consts::kModeTree) {
      std::cerr << "dir subtree invalid\n";
      return 1;
    }

    // Flattening the tree again gives back the same map
    if (gitemu::worktree::tree_to_map(repo, root_tree) != flat) {
      std::cerr << "tree_to_map does not invert write_tree_from_map\n";
      return 1;
    }

    // Overlay: index wins, and a file replaces a directory of the same name
    const gitemu::worktree::PathOidMap prev{{"dir/b.txt", std::string(64, '1')},
                                            {"keep.txt", std::string(64, '2')}};
    const gitemu::worktree::PathOidMap delta{{"dir", std::string(64, '3')}};
    const auto merged = gitemu::worktree::overlay(prev, delta);
    if (merged.size() != 2 || merged.at("dir") != std::string(64, '3') ||
        merged.count("dir/b.txt") != 0 || merged.at("keep.txt") != std::string(64, '2')) {
      std::cerr << "overlay did not displace the clashing directory\n";
      return 1;
    }

    // Paths outside the repository or into metadata are rejected
    for (const char *bad : {"../escape.txt", "/etc/passwd", ".gitemu/HEAD", "missing.txt"}) {
      bool rejected = false;
      try {
        (void)repo.add({bad});
      } catch (const gitemu::Error &e) {
        rejected = e.kind() == gitemu::ErrorKind::PathNotFound;
      }
      if (!rejected) {
        std::cerr << "add accepted " << bad << "\n";
        return 1;
      }
    }

    // Names with trailing blanks, line breaks and backslashes survive the index file
    const std::vector<std::string> odd{"sp ", "b\nc", "back\\slash", "cr\r"};
    for (const auto &name : odd) {
      write_file(root / name, name + "\n");
    }
    (void)repo.add(odd);
    idx.load();
    for (const auto &name : odd) {
      const auto id = idx.find(name);
      if (!id || gitemu::to_hex(*id) !=
                     gitemu::compute_blob_hex_oid(gitemu::fs::as_bytes(name + "\n"))) {
        std::cerr << "index lost the exact name [" << name << "]\n";
        return 1;
      }
    }
    if (idx.find("sp") || idx.find("b")) {
      std::cerr << "index recorded a mangled name\n";
      return 1;
    }

    (void)repo.commit("odd names", gitemu::Identity{.name = "T", .email = "t@e"});
    const auto st = repo.status();
    if (!st.clean()) {
      std::cerr << "odd names not clean after commit (" << st.unstaged.size() << " unstaged, "
                << st.untracked.size() << " untracked)\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
