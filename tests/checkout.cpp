#include "gitemu/error.hpp"
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

static std::string read_text(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

template <typename Fn>
static bool throws_kind(gitemu::ErrorKind kind, Fn &&fn) {
  try {
    fn();
  } catch (const gitemu::Error &e) {
    return e.kind() == kind;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitemu_checkout_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const gitemu::Identity me{.name = "User", .email = "u@example.com"};
    gitemu::Repository repo{root};
    repo.init(me);

    // main: a.txt=v1, dir/keep.txt
    write_file(root / "a.txt", "v1\n");
    write_file(root / "dir/keep.txt", "keep\n");
    (void)repo.add({"."});
    const std::string c1 = repo.commit("base", me);

    // feature: a.txt=v2 plus new.txt
    repo.create_branch("feature");
    repo.checkout("feature");
    if (repo.current().branch != "feature") {
      std::cerr << "HEAD not on feature\n";
      return 1;
    }
    write_file(root / "a.txt", "v2\n");
    write_file(root / "new.txt", "new\n");
    (void)repo.add({"a.txt", "new.txt"});
    const std::string c2 = repo.commit("feature work", me);

    // back to main: working tree follows the snapshot
    repo.checkout("main");
    if (read_text(root / "a.txt") != "v1\n" || fs::exists(root / "new.txt") ||
        read_text(root / "dir/keep.txt") != "keep\n") {
      std::cerr << "working tree does not match main\n";
      return 1;
    }
    if (!repo.status().clean()) {
      std::cerr << "status not clean after checkout\n";
      return 1;
    }

    // Unknown targets
    if (!throws_kind(gitemu::ErrorKind::UnknownRef, [&] { repo.checkout("nope"); }) ||
        !throws_kind(gitemu::ErrorKind::UnknownRef, [&] { repo.checkout(std::string(64, 'c')); })) {
      std::cerr << "unknown target not rejected\n";
      return 1;
    }
    // A tree id is not a commit
    const auto tree_id = repo.read_commit(c1).tree_hex;
    if (!throws_kind(gitemu::ErrorKind::UnknownRef, [&] { repo.checkout(tree_id); })) {
      std::cerr << "checkout of a tree id was accepted\n";
      return 1;
    }

    // Staged changes block checkout and nothing moves
    write_file(root / "a.txt", "staged\n");
    (void)repo.add({"a.txt"});
    if (!throws_kind(gitemu::ErrorKind::UncommittedChanges, [&] { repo.checkout("feature"); }) ||
        repo.current().branch != "main" || read_text(root / "a.txt") != "staged\n") {
      std::cerr << "checkout with staged changes was not refused\n";
      return 1;
    }
    write_file(root / "a.txt", "v1\n");
    (void)repo.add({"a.txt"}); // back to committed content, index empties

    // Local edit to a file the switch would rewrite
    write_file(root / "a.txt", "local\n");
    if (!throws_kind(gitemu::ErrorKind::UncommittedChanges, [&] { repo.checkout("feature"); }) ||
        read_text(root / "a.txt") != "local\n") {
      std::cerr << "local modification would have been overwritten\n";
      return 1;
    }
    write_file(root / "a.txt", "v1\n");

    // Untracked file in the way of a tracked one
    write_file(root / "new.txt", "mine\n");
    if (!throws_kind(gitemu::ErrorKind::UncommittedChanges, [&] { repo.checkout("feature"); })) {
      std::cerr << "untracked file would have been overwritten\n";
      return 1;
    }
    fs::remove(root / "new.txt");

    // feature gains a file under a new directory; back on main an untracked
    // file sits where that directory must go
    repo.checkout("feature");
    write_file(root / "deep/leaf.txt", "leaf\n");
    (void)repo.add({"deep"});
    const std::string c2b = repo.commit("add deep/leaf.txt", me);
    repo.checkout("main");
    if (repo.read_commit(c2b).parent != c2 || fs::exists(root / "deep")) {
      std::cerr << "deep/ survived the switch back to main\n";
      return 1;
    }
    write_file(root / "deep", "blocker\n");
    if (!throws_kind(gitemu::ErrorKind::UncommittedChanges, [&] { repo.checkout("feature"); }) ||
        repo.current().branch != "main" || read_text(root / "a.txt") != "v1\n" ||
        fs::exists(root / "new.txt") || read_text(root / "deep") != "blocker\n") {
      std::cerr << "untracked file at a parent path was not guarded\n";
      return 1;
    }
    fs::remove(root / "deep");

    // ...and a directory of untracked files where the target has a file
    write_file(root / "new.txt/inner.txt", "inner\n");
    if (!throws_kind(gitemu::ErrorKind::UncommittedChanges, [&] { repo.checkout("feature"); }) ||
        repo.current().branch != "main" || read_text(root / "a.txt") != "v1\n" ||
        read_text(root / "new.txt/inner.txt") != "inner\n") {
      std::cerr << "untracked directory at a target file path was not guarded\n";
      return 1;
    }
    fs::remove_all(root / "new.txt");

    // an empty directory in the way is simply replaced
    fs::create_directories(root / "new.txt/empty");

    // Untracked files elsewhere survive a switch
    write_file(root / "scratch.txt", "notes\n");
    repo.checkout("feature");
    if (read_text(root / "a.txt") != "v2\n" || read_text(root / "new.txt") != "new\n" ||
        read_text(root / "deep/leaf.txt") != "leaf\n" ||
        read_text(root / "scratch.txt") != "notes\n") {
      std::cerr << "working tree does not match feature\n";
      return 1;
    }

    // Detached HEAD at a commit id
    repo.checkout(c1);
    const auto head = repo.current();
    if (!head.detached || head.oid != c1 || read_text(root / "a.txt") != "v1\n") {
      std::cerr << "detached checkout failed\n";
      return 1;
    }
    // commits on a detached HEAD move HEAD only
    write_file(root / "d.txt", "d\n");
    (void)repo.add({"d.txt"});
    const std::string c3 = repo.commit("detached work", me);
    if (repo.current().oid != c3 || repo.log().size() != 2) {
      std::cerr << "detached commit did not advance HEAD\n";
      return 1;
    }
    for (const auto &b : repo.list_branches()) {
      if (b.current || b.target == c3) {
        std::cerr << "a branch followed the detached commit\n";
        return 1;
      }
    }

    repo.checkout("feature");
    if (repo.current().branch != "feature" || repo.log().front().id != c2b ||
        fs::exists(root / "d.txt")) {
      std::cerr << "return to feature failed\n";
      return 1;
    }

    std::cout << "checkout OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
