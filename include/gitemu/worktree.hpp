#pragma once
#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace gitemu {

class Repository; // fwd

namespace worktree {

using PathOidMap = std::map<std::string, std::string>; // path -> 64-hex blob id

// Enumerate regular files under `dir` (repo-relative to `root`), excluding the .gitemu directory
void enumerate_paths(const std::filesystem::path& root, std::set<std::string>& out_paths);
void enumerate_paths(const std::filesystem::path& root, const std::filesystem::path& dir,
                     std::set<std::string>& out_paths);

// Blob id of the file at root/rel, or empty string if it is not a regular file
auto hash_working_file(const std::filesystem::path& root, const std::string& rel) -> std::string;

// Build path->hex map from a tree object (recursive)
auto tree_to_map(const Repository& repo, const std::string& tree_hex) -> PathOidMap;

// Lay `index` over `base`: index paths win, and a staged path replaces any
// base entry that is its parent directory or lives beneath it.
auto overlay(const PathOidMap& base, const PathOidMap& index) -> PathOidMap;

// Fold a flat path map into nested tree objects; returns the root tree id.
auto write_tree_from_map(const Repository& repo, const PathOidMap& flat) -> std::string;

// Paths a move from `from` to `to` would rewrite or remove without the working
// copy being safe to replace: local edits, untracked files in the way, an
// untracked file where a parent directory is needed, or a directory holding
// untracked files where a file is needed.
auto conflicting_paths(const std::filesystem::path& root, const PathOidMap& from,
                       const PathOidMap& to) -> std::set<std::string>;

// Rewrite the working directory from snapshot `from` to snapshot `to`,
// touching only paths whose blob differs.
void switch_snapshot(const Repository& repo, const PathOidMap& from, const PathOidMap& to);

} // namespace worktree

} // namespace gitemu
