#pragma once
#include "gitemu/config.hpp"
#include "gitemu/consts.hpp"
#include "gitemu/hash.hpp"
#include "gitemu/refs.hpp"
#include "gitemu/status.hpp"
#include "gitemu/worktree.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitemu {

struct TreeEntry {
  std::uint32_t mode; // gitemu::consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 32-byte raw SHA-256 of referenced object
};

struct CommitInfo {
  std::string tree_hex;
  std::optional<std::string> parent; // linear history: zero or one parent
  std::string author;                // full author line after "author "
  std::string committer;             // full committer line
  std::string message;               // raw message (ends with '\n')

  // First line of the message.
  [[nodiscard]] std::string summary() const;
};

struct LogEntry {
  std::string id;
  CommitInfo info;
};

struct BranchInfo {
  std::string name;
  std::optional<std::string> target; // empty while unborn
  bool current = false;
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Walk from `start` up through its parents to the first directory holding
  // .gitemu. Throws NotARepository if none does.
  static Repository discover(const std::filesystem::path& start);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto git_dir() const -> std::filesystem::path { return root_ / consts::kGitDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return git_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return git_dir() / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir() / consts::kHeadFile;
  }
  [[nodiscard]] auto index_file() const -> std::filesystem::path {
    return git_dir() / consts::kIndexFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return git_dir() / consts::kConfigFile;
  }

  // Create the .gitemu layout with an unborn main branch.
  // Fails with AlreadyInitialized if .gitemu already exists (to avoid clobber).
  void init(const std::optional<Identity>& identity = std::nullopt) const;

  // Convenience: does .gitemu exist?
  [[nodiscard]] auto is_initialized() const -> bool;

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  // The parent, when given, must already be a commit in the store.
  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::optional<std::string> &parent_hex,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Staging. Paths are repository-relative; a directory stages every file
  // beneath it and "." stages the whole tree. Returns the paths now staged.
  // Content identical to the last commit is unstaged instead.
  auto add(const std::vector<std::string> &paths) const -> std::vector<std::string>;
  auto add_all() const -> std::vector<std::string>;

  // Fold the index over the last commit's tree into a new commit on HEAD.
  auto commit(std::string_view message, const Identity &author) const -> std::string;

  // Commits from HEAD back to the root (child first). Empty while unborn.
  [[nodiscard]] auto log() const -> std::vector<LogEntry>;

  [[nodiscard]] auto status() const -> Status;

  // Branches
  void create_branch(std::string_view name) const;
  void delete_branch(std::string_view name) const;
  void rename_branch(std::string_view old_name, std::string_view new_name) const;
  [[nodiscard]] auto list_branches() const -> std::vector<BranchInfo>;
  [[nodiscard]] auto current() const -> Head;

  // Switch HEAD to a branch, or detach it at a 64-hex commit id.
  void checkout(std::string_view target) const;

  // Lightweight tags at the HEAD commit
  void create_tag(std::string_view name) const;
  [[nodiscard]] auto list_tags() const -> std::vector<Ref>;

  // Key/value configuration in .gitemu/config
  [[nodiscard]] auto load_config() const -> Config;
  [[nodiscard]] auto get_config(std::string_view key) const -> std::optional<std::string>;
  void set_config(std::string_view key, std::string_view value) const;
  // False if the key was not set.
  bool unset_config(std::string_view key) const;

private:
  void require_initialized() const;
  [[nodiscard]] auto head_tree_map() const -> worktree::PathOidMap;
  [[nodiscard]] auto commit_tree_map(const std::optional<std::string> &commit_hex) const
      -> worktree::PathOidMap;
  auto stage_files(const std::vector<std::string> &rel_paths) const -> std::vector<std::string>;

  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
  std::shared_ptr<std::shared_mutex> mutex_;
};

// Seed a new repository at `dest` from an already materialized directory:
// copy its files (minus any .gitemu), then init + add_all + commit.
// Throws DestinationExists if `dest` exists, PathNotFound if `source` is not a directory.
auto import_tree(const std::filesystem::path &source, const std::filesystem::path &dest,
                 const Identity &identity) -> Repository;

} // namespace gitemu
