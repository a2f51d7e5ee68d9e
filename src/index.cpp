#include "gitemu/index.hpp"

#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/hash.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <sstream>

namespace gitemu {

namespace {

// Paths are stored verbatim except for backslash, LF and CR, which are
// written as \\, \n and \r so each entry stays on one line.
std::string escape_path(std::string_view path) {
  std::string out;
  out.reserve(path.size());
  for (const char c : path) {
    switch (c) {
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    default: out.push_back(c);
    }
  }
  return out;
}

std::optional<std::string> unescape_path(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\\') {
      out.push_back(text[i]);
      continue;
    }
    if (++i == text.size())
      return std::nullopt;
    switch (text[i]) {
    case '\\': out.push_back('\\'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    default: return std::nullopt;
    }
  }
  return out;
}

} // namespace

Index::Index(std::filesystem::path git_dir) : git_dir_(std::move(git_dir)) {}

std::filesystem::path Index::index_path() const { return git_dir_ / consts::kIndexFile; }

void Index::load() {
  entries_.clear();
  const auto p = index_path();
  if (!fs::exists(p))
    return;

  const auto bytes = fs::read_file(p);
  std::istringstream is(std::string(bytes.begin(), bytes.end()));

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(is, line)) {
    ++lineno;
    if (line.empty())
      continue;

    // format: "<octal> <hex> <path>"
    const auto sp1 = line.find(consts::kSpace);
    const auto sp2 = sp1 == std::string::npos ? sp1 : line.find(consts::kSpace, sp1 + 1);
    if (sp2 == std::string::npos) {
      throw Error(ErrorKind::CorruptObject,
                  "index: malformed entry on line " + std::to_string(lineno), p.string());
    }
    const std::string mode_str = line.substr(0, sp1);
    const std::string hex = line.substr(sp1 + 1, sp2 - sp1 - 1);
    auto path = unescape_path(std::string_view(line).substr(sp2 + 1));

    // parse octal
    std::uint32_t mode = 0;
    for (char c : mode_str) {
      if (c < '0' || c > '7') {
        mode = 0;
        break;
      }
      mode = (mode << 3) + static_cast<std::uint32_t>(c - '0');
    }

    IndexEntry e{};
    if (mode == 0 || !path || path->empty() || !from_hex(hex, e.id)) {
      throw Error(ErrorKind::CorruptObject,
                  "index: malformed entry on line " + std::to_string(lineno), p.string());
    }
    e.mode = mode;
    e.path = std::move(*path);
    entries_.push_back(std::move(e));
  }

  // Keep file order stable: sort by path
  std::ranges::sort(entries_, [](auto &a, auto &b) { return a.path < b.path; });
}

void Index::save() const {
  std::ostringstream os;
  for (const auto &e : entries_) {
    char mode_buf[16];
    std::snprintf(mode_buf, sizeof(mode_buf), "%o", e.mode);
    os << mode_buf << ' ' << to_hex(e.id) << ' ' << escape_path(e.path) << '\n';
  }
  const auto s = os.str();
  fs::write_file_atomic(index_path(), fs::as_bytes(s));
}

void Index::stage(std::string_view path, const oid &id, std::uint32_t mode) {
  const std::string key(path);
  auto it = std::ranges::lower_bound(entries_, key, {}, &IndexEntry::path);
  if (it != entries_.end() && it->path == path) {
    it->mode = mode;
    it->id = id;
    return;
  }
  entries_.insert(it, IndexEntry{.mode = mode, .id = id, .path = key});
}

void Index::unstage(std::string_view path) {
  std::erase_if(entries_, [&](const IndexEntry &e) { return e.path == path; });
}

std::optional<oid> Index::find(std::string_view path) const {
  const std::string key(path);
  const auto it = std::ranges::lower_bound(entries_, key, {}, &IndexEntry::path);
  if (it == entries_.end() || it->path != key)
    return std::nullopt;
  return it->id;
}

std::map<std::string, std::string> Index::as_path_oid_map() const {
  std::map<std::string, std::string> m;
  for (const auto &e : entries_) {
    m[e.path] = to_hex(e.id);
  }
  return m;
}

} // namespace gitemu
