#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitemu::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Write to a uniquely named temp file beside `p`, fsync it, then rename over `p`.
// The temp name ends in ".lock" so ref listings never mistake it for a ref.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Remove `p` and then every parent directory that became empty, stopping at `stop`.
void remove_and_prune(const std::filesystem::path& p, const std::filesystem::path& stop);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace gitemu::fs
