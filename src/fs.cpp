#include "scidata/fs.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace scidata::fs {

namespace {

constexpr std::size_t kMaxInflateRatio = 1032;

void remove_quietly(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.parent_path().empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs) {
      ofs.close();
      remove_quietly(tmp);
      throw std::runtime_error("flush temp failed: " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      remove_quietly(tmp);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

std::vector<std::uint8_t> deflate_raw(std::span<const std::uint8_t> data) {
  z_stream strm;
  std::memset(&strm, 0, sizeof(strm));

  // negative window bits: raw deflate, no zlib header/trailer
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("zlib deflateInit2 failed");
  }

  std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())));
  strm.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());
  strm.next_out = out.data();
  strm.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&strm, Z_FINISH);
  const auto produced = strm.total_out;
  deflateEnd(&strm);
  if (rc != Z_STREAM_END)
    throw std::runtime_error("zlib deflate failed");
  out.resize(produced);
  return out;
}

std::vector<std::uint8_t> inflate_raw(std::span<const std::uint8_t> data,
                                      std::size_t expected_size) {
  // deflate never expands beyond ~1032:1
  if (expected_size / kMaxInflateRatio > data.size()) {
    throw std::runtime_error("zlib inflate size exceeds what the stream can hold");
  }

  z_stream strm;
  std::memset(&strm, 0, sizeof(strm));
  if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
    throw std::runtime_error("zlib inflateInit2 failed");
  }

  // one spare byte so an oversized stream is detected instead of truncated
  std::vector<std::uint8_t> out(expected_size + 1);
  strm.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());
  strm.next_out = out.data();
  strm.avail_out = static_cast<uInt>(out.size());

  const int rc = inflate(&strm, Z_FINISH);
  const auto produced = strm.total_out;
  inflateEnd(&strm);
  if (rc != Z_STREAM_END)
    throw std::runtime_error("zlib inflate failed");
  if (produced != expected_size)
    throw std::runtime_error("zlib inflate size mismatch");
  out.resize(produced);
  return out;
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
  return static_cast<std::uint32_t>(
      ::crc32(0L, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(data.size())));
}

} // namespace scidata::fs
