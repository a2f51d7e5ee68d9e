#pragma once
#include "gitemu/consts.hpp"
#include "gitemu/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitemu {

struct IndexEntry {
  std::uint32_t mode;  // e.g., gitemu::consts::kModeFile
  oid           id;    // staged blob id (32 bytes)
  std::string   path;  // "dir/file", UTF-8, no leading '/'
};

// Staging area: paths slated for the next commit. Holds only the delta against
// the current commit; a successful commit clears it.
class Index {
public:
  explicit Index(std::filesystem::path git_dir);

  // Parse .gitemu/index if it exists (no throw if missing)
  void load();

  // Atomically replace .gitemu/index with current entries
  void save() const;

  // Insert or overwrite the entry for `path`.
  void stage(std::string_view path, const oid& id, std::uint32_t mode = consts::kModeFile);

  // Remove a path from index (no error if absent)
  void unstage(std::string_view path);

  void clear() { entries_.clear(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

  [[nodiscard]] std::optional<oid> find(std::string_view path) const;

  // Sorted by path.
  const std::vector<IndexEntry>& entries() const { return entries_; }
  std::map<std::string, std::string> as_path_oid_map() const;

private:
  std::filesystem::path index_path() const;

  std::filesystem::path git_dir_;
  std::vector<IndexEntry> entries_;
};

} // namespace gitemu
