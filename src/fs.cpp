#include "gitemu/fs.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

namespace gitemu::fs {

namespace {

std::atomic<unsigned long> g_temp_counter{0};

[[noreturn]] void throw_errno(const std::string &what, const std::filesystem::path &p) {
  throw Error(ErrorKind::Io, what + ": " + p.string() + ": " + std::strerror(errno), p.string());
}

std::filesystem::path temp_path_for(const std::filesystem::path &p) {
  auto tmp = p;
  tmp += "." + std::to_string(::getpid()) + "-" + std::to_string(++g_temp_counter);
  tmp += consts::kLockSuffix;
  return tmp;
}

// fsync the directory so the rename itself survives a crash.
void sync_dir(const std::filesystem::path &dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return; // not fatal: the data file itself is already synced
  }
  ::fsync(fd);
  ::close(fd);
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw Error(ErrorKind::Io, "mkdir -p failed: " + ec.message(), p.parent_path().string());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw Error(ErrorKind::Io, "open for read failed: " + p.string(), p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw Error(ErrorKind::Io, "read failed: " + p.string(), p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  const auto tmp = temp_path_for(p);

  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw_errno("open temp for write failed", tmp);
  }
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      const int saved = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      errno = saved;
      throw_errno("write temp failed", tmp);
    }
    off += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    const int saved = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    errno = saved;
    throw_errno("fsync temp failed", tmp);
  }
  if (::close(fd) != 0) {
    ::unlink(tmp.c_str());
    throw_errno("close temp failed", tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw Error(ErrorKind::Io, "atomic replace failed: " + p.string() + ": " + ec.message(),
                p.string());
  }
  sync_dir(p.parent_path());
}

void remove_and_prune(const std::filesystem::path &p, const std::filesystem::path &stop) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec)
    throw Error(ErrorKind::Io, "remove failed: " + p.string() + ": " + ec.message(), p.string());

  for (auto dir = p.parent_path(); dir != stop && dir.has_relative_path();
       dir = dir.parent_path()) {
    if (!std::filesystem::is_empty(dir, ec) || ec)
      break;
    std::filesystem::remove(dir, ec);
    if (ec)
      break;
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw Error(ErrorKind::Io, "zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw Error(ErrorKind::Io, "zlib inflateInit failed");

  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw Error(ErrorKind::CorruptObject, "zlib inflate failed");
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw Error(ErrorKind::CorruptObject, "zlib stream truncated");
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace gitemu::fs
