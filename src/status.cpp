#include "gitemu/status.hpp"

#include "gitemu/worktree.hpp"

#include <set>

namespace gitemu {

Status scan_worktree(const std::filesystem::path &root, const worktree::PathOidMap &index_map,
                     const worktree::PathOidMap &head_map) {
  Status st;

  // staged = index vs last commit; the index only carries the delta
  for (const auto &[path, hex] : index_map) {
    const auto it_h = head_map.find(path);
    if (it_h == head_map.end()) {
      st.staged.push_back({ChangeKind::Added, path});
    } else if (it_h->second != hex) {
      st.staged.push_back({ChangeKind::Modified, path});
    }
  }

  std::set<std::string> on_disk;
  worktree::enumerate_paths(root, on_disk);

  // unstaged = committed paths not in the index whose working copy differs
  for (const auto &[path, hex] : head_map) {
    if (index_map.contains(path))
      continue;
    if (!on_disk.contains(path)) {
      st.unstaged.push_back({ChangeKind::Deleted, path});
    } else if (worktree::hash_working_file(root, path) != hex) {
      st.unstaged.push_back({ChangeKind::Modified, path});
    }
  }

  // untracked = working - index - last commit (std::set keeps them sorted)
  for (const auto &p : on_disk) {
    if (!index_map.contains(p) && !head_map.contains(p))
      st.untracked.push_back(p);
  }
  return st;
}

} // namespace gitemu
