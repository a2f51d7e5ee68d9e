#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gitemu {

// Validate 64-char lowercase/uppercase hex
auto looks_hex64(std::string_view str) -> bool;

// Compute the blob object id for raw bytes without writing to the object store.
auto compute_blob_hex_oid(std::span<const std::uint8_t> bytes) -> std::string;

// First kShortHexLen characters of an id.
auto short_hex(std::string_view hex) -> std::string;

// Normalize a repository-relative path to "a/b/c" form. Returns nullopt if it
// is absolute, escapes the root with "..", or points into .gitemu. "." and ""
// normalize to "".
auto normalize_repo_path(std::string_view path) -> std::optional<std::string>;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);
  // Strip spaces/tabs/CR at both ends
  auto trim(std::string_view sv) -> std::string;
}

} // namespace gitemu
