#pragma once
#include "gitemu/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitemu {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Loose, zlib-compressed, write-once objects under .gitemu/objects/aa/bbbb...
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  // Read, inflate and verify the object identified by 64-hex.
  // Throws ObjectNotFound if absent, CorruptObject if it does not verify.
  [[nodiscard]] Object get(std::string_view hex_oid) const;

  // Store type/payload; returns the 64-hex id. Re-putting identical content
  // is a no-op on disk. The object is durable when this returns.
  std::string put(std::string_view type, std::span<const std::uint8_t> payload) const;

  [[nodiscard]] bool exists(std::string_view hex_oid) const;

  // Id the object would get, without writing it.
  static std::string hash_object(std::string_view type, std::span<const std::uint8_t> payload);

  // Get filesystem path for a binary oid.
  [[nodiscard]] std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path gitdir_;
};

} // namespace gitemu
