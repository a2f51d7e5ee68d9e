#include "gitemu/refs.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/util.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace gitemu {

namespace {

std::optional<std::string> read_trimmed(const std::filesystem::path &p) {
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  const auto bytes = fs::read_file(p);
  std::string s(bytes.begin(), bytes.end());
  strutil::rstrip_newlines(s);
  return s;
}

void write_text(const std::filesystem::path &p, const std::string &s) {
  fs::write_file_atomic(p, fs::as_bytes(s));
}

// Collect refs below `dir`, skipping in-flight temp files.
std::vector<Ref> list_refs(const std::filesystem::path &dir) {
  std::vector<Ref> out;
  if (!fs::exists(dir))
    return out;
  for (auto it = std::filesystem::recursive_directory_iterator(dir);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    if (!it->is_regular_file())
      continue;
    std::string name = std::filesystem::relative(it->path(), dir).generic_string();
    if (name.ends_with(consts::kLockSuffix))
      continue;
    auto target = read_trimmed(it->path());
    Ref ref{.name = std::move(name), .target = std::nullopt};
    if (target && !target->empty())
      ref.target = std::move(*target);
    out.push_back(std::move(ref));
  }
  std::ranges::sort(out, {}, &Ref::name);
  return out;
}

} // namespace

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsRefPrefix) + std::string(branch);
}

bool is_valid_ref_name(std::string_view name) {
  if (name.empty() || name.front() == '-' || name.front() == '/' || name.back() == '/' ||
      name.back() == '.') {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("//") != std::string_view::npos ||
      name.find("@{") != std::string_view::npos || name.ends_with(consts::kLockSuffix)) {
    return false;
  }
  for (const char c : name) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f || c == ' ' || c == '~' || c == '^' || c == ':' || c == '?' ||
        c == '*' || c == '[' || c == '\\') {
      return false;
    }
  }
  // no component may start with '.' or end with ".lock"
  std::size_t start = 0;
  while (start <= name.size()) {
    const auto slash = name.find('/', start);
    const auto comp = name.substr(start, slash == std::string_view::npos ? name.npos : slash - start);
    if (comp.empty() || comp.front() == '.' || comp.ends_with(consts::kLockSuffix))
      return false;
    if (slash == std::string_view::npos)
      break;
    start = slash + 1;
  }
  return true;
}

std::filesystem::path RefStore::head_file() const { return git_dir_ / consts::kHeadFile; }

std::filesystem::path RefStore::heads_dir() const {
  return git_dir_ / consts::kRefsDir / consts::kHeadsDir;
}

std::filesystem::path RefStore::tags_dir() const {
  return git_dir_ / consts::kRefsDir / consts::kTagsDir;
}

Head RefStore::read_head() const {
  const auto txt = read_trimmed(head_file());
  if (!txt) {
    throw Error(ErrorKind::CorruptObject, "HEAD is missing", "HEAD");
  }
  Head head;
  if (txt->starts_with(consts::kRefPrefix)) {
    const std::string refname = txt->substr(consts::kRefPrefix.size());
    if (!refname.starts_with(consts::kHeadsRefPrefix)) {
      throw Error(ErrorKind::CorruptObject, "HEAD points outside refs/heads: " + refname, "HEAD");
    }
    head.branch = refname.substr(consts::kHeadsRefPrefix.size());
    return head;
  }
  if (!looks_hex64(*txt)) {
    throw Error(ErrorKind::CorruptObject, "HEAD is neither symbolic nor a commit id", "HEAD");
  }
  head.detached = true;
  head.oid = *txt;
  return head;
}

void RefStore::set_head_symbolic(std::string_view branch) const {
  write_text(head_file(), std::string(consts::kRefPrefix) + heads_ref(branch) + "\n");
}

void RefStore::set_head_detached(std::string_view hex_oid) const {
  write_text(head_file(), std::string(hex_oid) + "\n");
}

std::optional<std::string> RefStore::head_commit() const {
  const Head head = read_head();
  if (head.detached) {
    return head.oid;
  }
  const auto ref = read_branch(head.branch);
  if (!ref) {
    // HEAD names a branch with no ref file yet: treat as unborn
    return std::nullopt;
  }
  return ref->target;
}

std::optional<Ref> RefStore::read_branch(std::string_view name) const {
  if (!is_valid_ref_name(name)) {
    return std::nullopt;
  }
  const auto p = heads_dir() / std::string(name);
  if (!std::filesystem::is_regular_file(p)) {
    return std::nullopt;
  }
  auto txt = read_trimmed(p);
  Ref ref{.name = std::string(name), .target = std::nullopt};
  if (txt && !txt->empty()) {
    if (!looks_hex64(*txt)) {
      throw Error(ErrorKind::CorruptObject, "ref is not a commit id: " + heads_ref(name),
                  std::string(name));
    }
    ref.target = std::move(*txt);
  }
  return ref;
}

void RefStore::write_branch(std::string_view name, const std::optional<std::string> &target) const {
  const std::string s = target ? *target + "\n" : std::string{};
  write_text(heads_dir() / std::string(name), s);
}

void RefStore::remove_branch(std::string_view name) const {
  fs::remove_and_prune(heads_dir() / std::string(name), heads_dir());
}

std::vector<Ref> RefStore::branches() const { return list_refs(heads_dir()); }

std::optional<std::string> RefStore::read_tag(std::string_view name) const {
  if (!is_valid_ref_name(name)) {
    return std::nullopt;
  }
  const auto p = tags_dir() / std::string(name);
  if (!std::filesystem::is_regular_file(p)) {
    return std::nullopt;
  }
  return read_trimmed(p);
}

void RefStore::write_tag(std::string_view name, std::string_view hex_oid) const {
  write_text(tags_dir() / std::string(name), std::string(hex_oid) + "\n");
}

std::vector<Ref> RefStore::tags() const { return list_refs(tags_dir()); }

} // namespace gitemu
