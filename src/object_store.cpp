#include "gitemu/object_store.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"

#include <algorithm>
#include <charconv>
#include <string>

namespace gfs = gitemu::fs;

namespace gitemu {

namespace {

std::vector<std::uint8_t> framed(std::string_view type, std::span<const std::uint8_t> payload) {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());
  return store;
}

} // namespace

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::exists(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    return false;
  }
  return gfs::exists(path_for_oid(id));
}

Object ObjectStore::get(std::string_view hex_oid) const {
  const std::string subject(hex_oid);
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw Error(ErrorKind::ObjectNotFound, "object_store: bad oid hex: " + subject, subject);
  }
  const auto path = path_for_oid(id);
  if (!gfs::exists(path)) {
    throw Error(ErrorKind::ObjectNotFound, "object_store: no such object: " + subject, subject);
  }

  std::vector<std::uint8_t> store;
  try {
    store = gfs::z_decompress(gfs::read_file(path));
  } catch (const Error &e) {
    throw Error(ErrorKind::CorruptObject, "object_store: " + std::string(e.what()) + ": " + subject,
                subject);
  }

  if (sha256(store) != id) {
    throw Error(ErrorKind::CorruptObject, "object_store: hash mismatch: " + subject, subject);
  }

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw Error(ErrorKind::CorruptObject, "object_store: invalid header: " + subject, subject);
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw Error(ErrorKind::CorruptObject, "object_store: invalid header: " + subject, subject);
  }

  std::string type(store.begin(), it_space);
  const std::string size_str(it_space + 1, it_nul);
  std::size_t size = 0;
  const auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), size);
  const auto payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  if (ec != std::errc{} || ptr != size_str.data() + size_str.size() ||
      size != store.size() - payload_off) {
    throw Error(ErrorKind::CorruptObject, "object_store: size mismatch: " + subject, subject);
  }

  return Object{.type = std::move(type),
                .data = {store.begin() + static_cast<std::ptrdiff_t>(payload_off), store.end()}};
}

std::string ObjectStore::put(std::string_view type, std::span<const std::uint8_t> payload) const {
  const auto store = framed(type, payload);
  const oid store_id = sha256(store);
  const auto path = path_for_oid(store_id);
  // Write-once: an existing file already holds exactly these bytes.
  if (!gfs::exists(path)) {
    gfs::write_file_atomic(path, gfs::z_compress(store));
  }
  return to_hex(store_id);
}

std::string ObjectStore::hash_object(std::string_view type, std::span<const std::uint8_t> payload) {
  return to_hex(sha256(framed(type, payload)));
}

} // namespace gitemu
