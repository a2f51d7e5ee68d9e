#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitemu {

// A named pointer. An empty target is an unborn branch (no commits yet).
struct Ref {
  std::string name;                  // short name: "main", "feature/x", "v1"
  std::optional<std::string> target; // 64-hex commit id
};

// What HEAD names: a branch (symbolic) or a commit (detached).
struct Head {
  bool detached = false;
  std::string branch; // short branch name when symbolic
  std::string oid;    // commit id when detached
};

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Branch and tag names: no "..", whitespace, control characters or any of
// ~^:?*[\ ; no leading '-' or '/', no trailing '/' or ".lock", no empty components.
[[nodiscard]] bool is_valid_ref_name(std::string_view name);

class RefStore {
public:
  explicit RefStore(std::filesystem::path git_dir) : git_dir_(std::move(git_dir)) {}

  // Parse HEAD. Throws CorruptObject if HEAD is missing or unparsable.
  [[nodiscard]] Head read_head() const;

  // Write symbolic HEAD: "ref: refs/heads/<branch>\n"
  void set_head_symbolic(std::string_view branch) const;
  void set_head_detached(std::string_view hex_oid) const;

  // Commit HEAD resolves to; nullopt while the current branch is unborn.
  [[nodiscard]] std::optional<std::string> head_commit() const;

  // nullopt if the branch does not exist.
  [[nodiscard]] std::optional<Ref> read_branch(std::string_view name) const;
  // Create or overwrite; an empty target writes an unborn branch.
  void write_branch(std::string_view name, const std::optional<std::string>& target) const;
  void remove_branch(std::string_view name) const;
  [[nodiscard]] std::vector<Ref> branches() const;

  [[nodiscard]] std::optional<std::string> read_tag(std::string_view name) const;
  void write_tag(std::string_view name, std::string_view hex_oid) const;
  [[nodiscard]] std::vector<Ref> tags() const;

private:
  [[nodiscard]] std::filesystem::path head_file() const;
  [[nodiscard]] std::filesystem::path heads_dir() const;
  [[nodiscard]] std::filesystem::path tags_dir() const;

  std::filesystem::path git_dir_;
};

} // namespace gitemu
