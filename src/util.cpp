// Utility helpers for hex, object-id and path computations
#include "gitemu/util.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/object_store.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace gitemu {

bool looks_hex64(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string compute_blob_hex_oid(std::span<const std::uint8_t> bytes) {
  return ObjectStore::hash_object(consts::kTypeBlob, bytes);
}

std::string short_hex(std::string_view hex) {
  return std::string(hex.substr(0, std::min(hex.size(), consts::kShortHexLen)));
}

std::optional<std::string> normalize_repo_path(std::string_view path) {
  if (!path.empty() && path.front() == '/') {
    return std::nullopt;
  }
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto slash = path.find('/', start);
    const auto comp =
        path.substr(start, slash == std::string_view::npos ? path.npos : slash - start);
    if (comp == "..") {
      if (parts.empty())
        return std::nullopt;
      parts.pop_back();
    } else if (!comp.empty() && comp != ".") {
      parts.emplace_back(comp);
    }
    if (slash == std::string_view::npos)
      break;
    start = slash + 1;
  }
  if (!parts.empty() && parts.front() == consts::kGitDir) {
    return std::nullopt;
  }
  std::string out;
  for (const auto &p : parts) {
    if (!out.empty())
      out.push_back('/');
    out += p;
  }
  return out;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace gitemu
