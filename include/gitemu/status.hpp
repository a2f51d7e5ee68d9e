#pragma once
#include "gitemu/refs.hpp"
#include "gitemu/worktree.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gitemu {

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted };

struct Change {
  ChangeKind kind;
  std::string path;  // repo-relative
};

// Three disjoint path sets, each sorted by path.
struct Status {
  Head head;
  bool has_commits = false;
  std::vector<Change> staged;         // index vs last commit
  std::vector<Change> unstaged;       // last commit vs working, not staged
  std::vector<std::string> untracked; // working - index - last commit

  [[nodiscard]] bool clean() const {
    return staged.empty() && unstaged.empty() && untracked.empty();
  }
};

// Compare the working tree under `root` against the staged and committed maps.
auto scan_worktree(const std::filesystem::path& root, const worktree::PathOidMap& index_map,
                   const worktree::PathOidMap& head_map) -> Status;

} // namespace gitemu
