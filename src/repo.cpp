#include "gitemu/repo.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/index.hpp"
#include "gitemu/lock.hpp"
#include "gitemu/object_store.hpp"
#include "gitemu/refs.hpp"
#include "gitemu/status.hpp"
#include "gitemu/time.hpp"
#include "gitemu/util.hpp"
#include "gitemu/worktree.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace gfs   = gitemu::fs;

namespace gitemu {

auto CommitInfo::summary() const -> std::string {
  const auto nl = message.find('\n');
  return nl == std::string::npos ? message : message.substr(0, nl);
}

Repository::Repository(stdfs::path root)
    : root_(std::move(root)), mutex_(repository_mutex(root_)) {}

auto Repository::discover(const stdfs::path& start) -> Repository {
  std::error_code ec;
  stdfs::path dir = stdfs::absolute(start, ec);
  if (ec) {
    throw Error(ErrorKind::NotARepository, "cannot resolve " + start.string(), start.string());
  }
  dir = dir.lexically_normal();
  for (;;) {
    if (stdfs::is_directory(dir / consts::kGitDir, ec)) {
      return Repository{dir};
    }
    const auto parent = dir.parent_path();
    if (parent == dir || parent.empty()) {
      break;
    }
    dir = parent;
  }
  throw Error(ErrorKind::NotARepository,
              "not a gitemu repository (or any of the parent directories): " + start.string(),
              start.string());
}

auto Repository::is_initialized() const -> bool { return stdfs::is_directory(git_dir()); }

void Repository::require_initialized() const {
  if (!is_initialized()) {
    throw Error(ErrorKind::NotARepository, "not a gitemu repository: " + root_.string(),
                root_.string());
  }
}

void Repository::init(const std::optional<Identity>& identity) const {
  const std::unique_lock lock(*mutex_);
  if (is_initialized()) {
    throw Error(ErrorKind::AlreadyInitialized,
                "a gitemu repository already exists at: " + git_dir().string(),
                git_dir().string());
  }

  for (const auto& dir : {objects_dir(), heads_dir(), tags_dir()}) {
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw Error(ErrorKind::Io, "create " + dir.string() + " failed: " + ec.message(),
                  dir.string());
    }
  }

  const RefStore refs{git_dir()};
  refs.write_branch(consts::kDefaultBranch, std::nullopt);
  refs.set_head_symbolic(consts::kDefaultBranch);

  Index{git_dir()}.save();

  Config config;
  config.set(consts::kFormatVersionKey, "0");
  if (identity) {
    config.set(consts::kUserNameKey, identity->name);
    config.set(consts::kUserEmailKey, identity->email);
  }
  config.save(config_file());
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      break;
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  const ObjectStore store{git_dir()};
  return store.put(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  const ObjectStore store{git_dir()};
  auto [type, data] = store.get(hex_oid);
  if (type != consts::kTypeBlob) {
    throw Error(ErrorKind::CorruptObject, "object is not a blob: " + std::string(hex_oid),
                std::string(hex_oid));
  }
  return std::move(data);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries,
                    [](const TreeEntry& a, const TreeEntry& b) { return a.name < b.name; });

  std::string data;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    if (e.name.empty() || e.name.find('/') != std::string::npos ||
        e.name.find(consts::kNul) != std::string::npos) {
      throw Error(ErrorKind::CorruptObject, "invalid tree entry name: " + e.name, e.name);
    }
    if (i > 0 && entries[i - 1].name == e.name) {
      throw Error(ErrorKind::CorruptObject, "duplicate tree entry: " + e.name, e.name);
    }
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }

  const ObjectStore store{git_dir()};
  return store.put(consts::kTypeTree, gfs::as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const ObjectStore os{git_dir()};
  const auto [type, data] = os.get(hex_oid);
  const std::string subject(hex_oid);
  if (type != consts::kTypeTree) {
    throw Error(ErrorKind::CorruptObject, "object is not a tree: " + subject, subject);
  }

  std::vector<TreeEntry> out;
  auto p   = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw Error(ErrorKind::CorruptObject, "tree parse: expected space in " + subject, subject);
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw Error(ErrorKind::CorruptObject, "tree parse: expected NUL in " + subject, subject);
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw Error(ErrorKind::CorruptObject, "tree parse: truncated oid in " + subject, subject);
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::optional<std::string>& parent_hex,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  const ObjectStore store{git_dir()};
  if (!store.exists(tree_hex)) {
    throw Error(ErrorKind::ObjectNotFound, "commit tree missing: " + std::string(tree_hex),
                std::string(tree_hex));
  }
  if (parent_hex && !store.exists(*parent_hex)) {
    throw Error(ErrorKind::ObjectNotFound, "commit parent missing: " + *parent_hex, *parent_hex);
  }

  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += consts::kLF;

  if (parent_hex) {
    txt += consts::kParentPrefix;
    txt += *parent_hex;
    txt += consts::kLF;
  }

  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += consts::kLF;

  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";

  txt += message;
  if (txt.back() != consts::kLF) {
    txt += consts::kLF;
  }

  return store.put(consts::kTypeCommit, gfs::as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const ObjectStore store{git_dir()};
  const auto obj = store.get(commit_hex);
  const std::string subject(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw Error(ErrorKind::CorruptObject, "object is not a commit: " + subject, subject);
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size());
    } else if (line.starts_with(consts::kParentPrefix)) {
      if (info.parent) {
        throw Error(ErrorKind::CorruptObject, "commit has more than one parent: " + subject,
                    subject);
      }
      info.parent = line.substr(consts::kParentPrefix.size());
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  if (!looks_hex64(info.tree_hex) || (info.parent && !looks_hex64(*info.parent))) {
    throw Error(ErrorKind::CorruptObject, "commit headers malformed: " + subject, subject);
  }
  return info;
}

// Snapshots

auto Repository::commit_tree_map(const std::optional<std::string>& commit_hex) const
    -> worktree::PathOidMap {
  if (!commit_hex) {
    return {};
  }
  return worktree::tree_to_map(*this, read_commit(*commit_hex).tree_hex);
}

auto Repository::head_tree_map() const -> worktree::PathOidMap {
  return commit_tree_map(RefStore{git_dir()}.head_commit());
}

// Staging

auto Repository::stage_files(const std::vector<std::string>& rel_paths) const
    -> std::vector<std::string> {
  const auto head_map = head_tree_map();
  Index idx{git_dir()};
  idx.load();

  std::vector<std::string> staged;
  for (const auto& rel : rel_paths) {
    const std::string hex = write_blob(gfs::read_file(root_ / rel));
    oid bin{};
    if (!from_hex(hex, bin)) {
      throw Error(ErrorKind::CorruptObject, "write_blob produced bad hex oid", rel);
    }

    // a staged path displaces entries that clash with it as file vs directory
    const std::string dir_prefix = rel + "/";
    std::vector<std::string> clashes;
    for (const auto& e : idx.entries()) {
      if (e.path.starts_with(dir_prefix) || rel.starts_with(e.path + "/")) {
        clashes.push_back(e.path);
      }
    }
    for (const auto& c : clashes) {
      idx.unstage(c);
    }

    if (const auto it = head_map.find(rel); it != head_map.end() && it->second == hex) {
      idx.unstage(rel); // back to the committed content
      continue;
    }
    idx.stage(rel, bin, consts::kModeFile);
    staged.push_back(rel);
  }
  idx.save();
  return staged;
}

auto Repository::add(const std::vector<std::string>& paths) const -> std::vector<std::string> {
  const std::unique_lock lock(*mutex_);
  require_initialized();

  // Resolve every pathspec before touching the index.
  std::set<std::string> files;
  for (const auto& raw : paths) {
    const auto rel = normalize_repo_path(raw);
    if (!rel) {
      throw Error(ErrorKind::PathNotFound, "pathspec outside repository: " + raw, raw);
    }
    const stdfs::path abs = rel->empty() ? root_ : root_ / *rel;
    std::error_code ec;
    if (stdfs::is_directory(abs, ec)) {
      worktree::enumerate_paths(root_, abs, files);
    } else if (stdfs::is_regular_file(abs, ec)) {
      files.insert(*rel);
    } else {
      throw Error(ErrorKind::PathNotFound, "pathspec did not match any files: " + raw, raw);
    }
  }
  return stage_files({files.begin(), files.end()});
}

auto Repository::add_all() const -> std::vector<std::string> {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  std::set<std::string> files;
  worktree::enumerate_paths(root_, files);
  return stage_files({files.begin(), files.end()});
}

// Commit graph

auto Repository::commit(std::string_view message, const Identity& author) const -> std::string {
  const std::unique_lock lock(*mutex_);
  require_initialized();

  Index idx{git_dir()};
  idx.load();
  if (idx.empty()) {
    throw Error(ErrorKind::NothingToCommit, "nothing to commit, working tree clean");
  }

  const RefStore refs{git_dir()};
  const Head head = refs.read_head();
  const auto parent = refs.head_commit();

  // 1) tree = previous snapshot overlaid by the index
  const ObjectStore store{git_dir()};
  const auto staged = idx.as_path_oid_map();
  for (const auto& [path, hex] : staged) {
    if (!store.exists(hex)) {
      throw Error(ErrorKind::ObjectNotFound, "staged blob missing for " + path + ": " + hex, hex);
    }
  }
  const auto snapshot = worktree::overlay(commit_tree_map(parent), staged);
  const std::string tree_hex = worktree::write_tree_from_map(*this, snapshot);

  // 2) commit object, durable before any ref moves
  const std::time_t now = std::time(nullptr);
  const int tz_min = timeutil::local_utc_offset_minutes(now);
  const std::string sig = timeutil::make_signature(author, now, tz_min);
  const std::string commit_hex = write_commit(tree_hex, parent, sig, sig, message);

  // 3) move the ref
  if (head.detached) {
    refs.set_head_detached(commit_hex);
  } else {
    refs.write_branch(head.branch, commit_hex);
  }

  // 4) the index has been folded into the commit
  idx.clear();
  idx.save();
  return commit_hex;
}

auto Repository::log() const -> std::vector<LogEntry> {
  const std::shared_lock lock(*mutex_);
  require_initialized();

  std::vector<LogEntry> out;
  std::set<std::string> seen;
  auto cur = RefStore{git_dir()}.head_commit();
  while (cur) {
    if (!seen.insert(*cur).second) {
      throw Error(ErrorKind::CorruptObject, "commit history loops at " + *cur, *cur);
    }
    auto info = read_commit(*cur);
    auto next = info.parent;
    out.push_back(LogEntry{.id = *cur, .info = std::move(info)});
    cur = std::move(next);
  }
  return out;
}

auto Repository::status() const -> Status {
  const std::shared_lock lock(*mutex_);
  require_initialized();

  const RefStore refs{git_dir()};
  const auto head_commit = refs.head_commit();
  Index idx{git_dir()};
  idx.load();

  Status st = scan_worktree(root_, idx.as_path_oid_map(), commit_tree_map(head_commit));
  st.head = refs.read_head();
  st.has_commits = head_commit.has_value();
  return st;
}

// Branches

auto Repository::current() const -> Head {
  const std::shared_lock lock(*mutex_);
  require_initialized();
  return RefStore{git_dir()}.read_head();
}

void Repository::create_branch(std::string_view name) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  const std::string n(name);
  if (!is_valid_ref_name(name)) {
    throw Error(ErrorKind::InvalidRefName, "'" + n + "' is not a valid branch name", n);
  }
  const RefStore refs{git_dir()};
  if (refs.read_branch(name)) {
    throw Error(ErrorKind::BranchExists, "a branch named '" + n + "' already exists", n);
  }
  refs.write_branch(name, refs.head_commit());
}

void Repository::delete_branch(std::string_view name) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  const std::string n(name);
  const RefStore refs{git_dir()};
  if (!refs.read_branch(name)) {
    throw Error(ErrorKind::UnknownRef, "branch '" + n + "' not found", n);
  }
  if (const Head head = refs.read_head(); !head.detached && head.branch == name) {
    throw Error(ErrorKind::BranchCheckedOut, "cannot delete branch '" + n + "' checked out", n);
  }
  refs.remove_branch(name);
}

void Repository::rename_branch(std::string_view old_name, std::string_view new_name) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  const std::string from(old_name);
  const std::string to(new_name);
  const RefStore refs{git_dir()};
  const auto ref = refs.read_branch(old_name);
  if (!ref) {
    throw Error(ErrorKind::UnknownRef, "branch '" + from + "' not found", from);
  }
  if (!is_valid_ref_name(new_name)) {
    throw Error(ErrorKind::InvalidRefName, "'" + to + "' is not a valid branch name", to);
  }
  if (refs.read_branch(new_name)) {
    throw Error(ErrorKind::BranchExists, "a branch named '" + to + "' already exists", to);
  }
  if (const Head head = refs.read_head(); !head.detached && head.branch == old_name) {
    throw Error(ErrorKind::BranchCheckedOut, "cannot rename branch '" + from + "' checked out",
                from);
  }
  refs.write_branch(new_name, ref->target);
  refs.remove_branch(old_name);
}

auto Repository::list_branches() const -> std::vector<BranchInfo> {
  const std::shared_lock lock(*mutex_);
  require_initialized();
  const RefStore refs{git_dir()};
  const Head head = refs.read_head();

  std::vector<BranchInfo> out;
  for (auto& ref : refs.branches()) {
    const bool cur = !head.detached && ref.name == head.branch;
    out.push_back(BranchInfo{.name = std::move(ref.name), .target = std::move(ref.target),
                             .current = cur});
  }
  return out;
}

void Repository::checkout(std::string_view target) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  const std::string name(target);
  const RefStore refs{git_dir()};

  // Resolve target: branch first, then a full commit id
  std::optional<std::string> commit_hex;
  bool to_branch = false;
  if (const auto ref = refs.read_branch(target)) {
    to_branch = true;
    commit_hex = ref->target;
  } else if (const ObjectStore store{git_dir()};
             looks_hex64(target) && store.exists(target) &&
             store.get(target).type == consts::kTypeCommit) {
    commit_hex = name;
  } else {
    throw Error(ErrorKind::UnknownRef, "pathspec '" + name + "' did not match any ref", name);
  }

  Index idx{git_dir()};
  idx.load();
  if (!idx.empty()) {
    throw Error(ErrorKind::UncommittedChanges, "staged changes would be lost by checkout", name);
  }

  const auto from = head_tree_map();
  const auto to = commit_tree_map(commit_hex);
  if (const auto at_risk = worktree::conflicting_paths(root_, from, to); !at_risk.empty()) {
    std::string msg = "local changes would be overwritten by checkout:";
    for (const auto& p : at_risk) {
      msg += ' ';
      msg += p;
    }
    throw Error(ErrorKind::UncommittedChanges, msg, *at_risk.begin());
  }

  worktree::switch_snapshot(*this, from, to);

  if (to_branch) {
    refs.set_head_symbolic(target);
  } else {
    refs.set_head_detached(*commit_hex);
  }
}

// Tags

void Repository::create_tag(std::string_view name) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  const std::string n(name);
  if (!is_valid_ref_name(name)) {
    throw Error(ErrorKind::InvalidRefName, "'" + n + "' is not a valid tag name", n);
  }
  const RefStore refs{git_dir()};
  if (refs.read_tag(name)) {
    throw Error(ErrorKind::TagExists, "tag '" + n + "' already exists", n);
  }
  const auto head_commit = refs.head_commit();
  if (!head_commit) {
    throw Error(ErrorKind::UnknownRef, "HEAD has no commit to tag", "HEAD");
  }
  refs.write_tag(name, *head_commit);
}

auto Repository::list_tags() const -> std::vector<Ref> {
  const std::shared_lock lock(*mutex_);
  require_initialized();
  return RefStore{git_dir()}.tags();
}

// Config

auto Repository::load_config() const -> Config {
  const std::shared_lock lock(*mutex_);
  require_initialized();
  return Config::load(config_file());
}

auto Repository::get_config(std::string_view key) const -> std::optional<std::string> {
  return load_config().get(key);
}

void Repository::set_config(std::string_view key, std::string_view value) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  auto config = Config::load(config_file());
  config.set(key, value);
  config.save(config_file());
}

bool Repository::unset_config(std::string_view key) const {
  const std::unique_lock lock(*mutex_);
  require_initialized();
  auto config = Config::load(config_file());
  if (!config.unset(key)) {
    return false;
  }
  config.save(config_file());
  return true;
}

// Import

auto import_tree(const stdfs::path& source, const stdfs::path& dest, const Identity& identity)
    -> Repository {
  std::error_code ec;
  if (!stdfs::is_directory(source, ec)) {
    throw Error(ErrorKind::PathNotFound, "source is not a directory: " + source.string(),
                source.string());
  }
  if (stdfs::exists(dest, ec)) {
    throw Error(ErrorKind::DestinationExists,
                "destination path '" + dest.string() + "' already exists", dest.string());
  }

  std::set<std::string> files;
  worktree::enumerate_paths(source, files);
  stdfs::create_directories(dest, ec);
  if (ec) {
    throw Error(ErrorKind::Io, "create " + dest.string() + " failed: " + ec.message(),
                dest.string());
  }
  for (const auto& rel : files) {
    gfs::write_file_atomic(dest / rel, gfs::read_file(source / rel));
  }

  auto label = stdfs::absolute(source, ec).lexically_normal();
  if (!label.has_filename()) {
    label = label.parent_path();
  }

  Repository repo{dest};
  repo.init(identity);
  if (!repo.add_all().empty()) {
    (void)repo.commit("Initial import from " + label.filename().string(), identity);
  }
  return repo;
}

} // namespace gitemu
