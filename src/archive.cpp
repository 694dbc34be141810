#include "scidata/archive.hpp"

#include "scidata/errors.hpp"
#include "scidata/fs.hpp"

#include <limits>
#include <set>
#include <stdexcept>
#include <string_view>

namespace scidata::archive {

namespace {

constexpr std::uint32_t kLocalSig   = 0x04034b50;
constexpr std::uint32_t kCentralSig = 0x02014b50;
constexpr std::uint32_t kEndSig     = 0x06054b50;

constexpr std::uint16_t kVersion   = 20;     // 2.0: deflate
constexpr std::uint16_t kFlagUtf8  = 0x0800; // general purpose bit 11
constexpr std::uint16_t kFlagCrypt = 0x0001;
constexpr std::uint16_t kStored    = 0;
constexpr std::uint16_t kDeflated  = 8;

constexpr std::size_t kLocalHeaderLen   = 30;
constexpr std::size_t kCentralHeaderLen = 46;
constexpr std::size_t kEndRecordLen     = 22;

void put16(std::vector<std::uint8_t> &out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xff));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xff));
}

void put32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xff));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xff));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xff));
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xff));
}

// Bounds-checked little-endian reader over the package bytes.
class Reader {
public:
  explicit Reader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

  [[nodiscard]] std::uint16_t u16(std::size_t at) const {
    need(at, 2);
    return static_cast<std::uint16_t>(bytes_[at] | (bytes_[at + 1] << 8));
  }

  [[nodiscard]] std::uint32_t u32(std::size_t at) const {
    need(at, 4);
    return static_cast<std::uint32_t>(bytes_[at]) |
           (static_cast<std::uint32_t>(bytes_[at + 1]) << 8) |
           (static_cast<std::uint32_t>(bytes_[at + 2]) << 16) |
           (static_cast<std::uint32_t>(bytes_[at + 3]) << 24);
  }

  [[nodiscard]] std::span<const std::uint8_t> slice(std::size_t at, std::size_t n) const {
    need(at, n);
    return bytes_.subspan(at, n);
  }

  [[nodiscard]] std::size_t size() const { return bytes_.size(); }

private:
  void need(std::size_t at, std::size_t n) const {
    if (at > bytes_.size() || n > bytes_.size() - at) {
      throw CorruptArchive("zip: truncated package");
    }
  }

  std::span<const std::uint8_t> bytes_;
};

struct DosTime {
  std::uint16_t time;
  std::uint16_t date;
};

DosTime to_dos(std::time_t when) {
  std::tm t{};
#if defined(_WIN32)
  gmtime_s(&t, &when);
#else
  gmtime_r(&when, &t);
#endif
  if (t.tm_year < 80) { // DOS dates start in 1980
    return DosTime{.time = 0, .date = (1 << 5) | 1};
  }
  return DosTime{
      .time = static_cast<std::uint16_t>((t.tm_hour << 11) | (t.tm_min << 5) | (t.tm_sec / 2)),
      .date = static_cast<std::uint16_t>(((t.tm_year - 80) << 9) | ((t.tm_mon + 1) << 5) |
                                         t.tm_mday)};
}

std::uint32_t checked32(std::size_t v, std::string_view what) {
  if (v > std::numeric_limits<std::uint32_t>::max()) {
    throw std::runtime_error("zip: " + std::string(what) + " exceeds 4 GiB (no zip64 support)");
  }
  return static_cast<std::uint32_t>(v);
}

} // namespace

std::vector<std::uint8_t> write_zip(const std::vector<Entry> &entries, std::time_t when) {
  if (entries.size() > std::numeric_limits<std::uint16_t>::max()) {
    throw std::runtime_error("zip: too many entries");
  }
  const DosTime stamp = to_dos(when);

  std::vector<std::uint8_t> out;
  std::vector<std::uint8_t> central;

  for (const auto &e : entries) {
    if (e.name.size() > std::numeric_limits<std::uint16_t>::max()) {
      throw std::runtime_error("zip: entry name too long");
    }
    const std::uint32_t crc = fs::crc32(e.data);
    auto packed = fs::deflate_raw(e.data);
    std::uint16_t method = kDeflated;
    if (packed.size() >= e.data.size()) {
      packed = e.data;
      method = kStored;
    }
    const auto offset = checked32(out.size(), "archive");
    const auto csize = checked32(packed.size(), "entry");
    const auto usize = checked32(e.data.size(), "entry");
    const auto name_len = static_cast<std::uint16_t>(e.name.size());

    // local file header
    put32(out, kLocalSig);
    put16(out, kVersion);
    put16(out, kFlagUtf8);
    put16(out, method);
    put16(out, stamp.time);
    put16(out, stamp.date);
    put32(out, crc);
    put32(out, csize);
    put32(out, usize);
    put16(out, name_len);
    put16(out, 0); // extra length
    out.insert(out.end(), e.name.begin(), e.name.end());
    out.insert(out.end(), packed.begin(), packed.end());

    // central directory record
    put32(central, kCentralSig);
    put16(central, kVersion); // made by
    put16(central, kVersion); // needed
    put16(central, kFlagUtf8);
    put16(central, method);
    put16(central, stamp.time);
    put16(central, stamp.date);
    put32(central, crc);
    put32(central, csize);
    put32(central, usize);
    put16(central, name_len);
    put16(central, 0); // extra length
    put16(central, 0); // comment length
    put16(central, 0); // disk number
    put16(central, 0); // internal attributes
    put32(central, 0); // external attributes
    put32(central, offset);
    central.insert(central.end(), e.name.begin(), e.name.end());
  }

  const auto cd_offset = checked32(out.size(), "archive");
  const auto cd_size = checked32(central.size(), "central directory");
  out.insert(out.end(), central.begin(), central.end());

  const auto count = static_cast<std::uint16_t>(entries.size());
  put32(out, kEndSig);
  put16(out, 0); // this disk
  put16(out, 0); // disk with central directory
  put16(out, count);
  put16(out, count);
  put32(out, cd_size);
  put32(out, cd_offset);
  put16(out, 0); // comment length
  return out;
}

std::vector<Entry> read_zip(std::span<const std::uint8_t> bytes) {
  const Reader r{bytes};
  if (r.size() < kEndRecordLen) {
    throw CorruptArchive("zip: package too small");
  }

  // The end record sits in the last 22 bytes plus an optional comment.
  std::size_t end_at = r.size() - kEndRecordLen;
  const std::size_t floor =
      r.size() > kEndRecordLen + 0xFFFF ? r.size() - kEndRecordLen - 0xFFFF : 0;
  while (r.u32(end_at) != kEndSig) {
    if (end_at == floor) {
      throw CorruptArchive("zip: end of central directory not found");
    }
    --end_at;
  }

  const std::uint16_t count = r.u16(end_at + 10);
  const std::uint32_t cd_offset = r.u32(end_at + 16);

  std::vector<Entry> entries;
  entries.reserve(count);
  std::set<std::string, std::less<>> seen;

  std::size_t at = cd_offset;
  for (std::uint16_t i = 0; i < count; ++i) {
    if (r.u32(at) != kCentralSig) {
      throw CorruptArchive("zip: bad central directory signature");
    }
    const std::uint16_t flags = r.u16(at + 8);
    const std::uint16_t method = r.u16(at + 10);
    const std::uint32_t crc = r.u32(at + 16);
    const std::uint32_t csize = r.u32(at + 20);
    const std::uint32_t usize = r.u32(at + 24);
    const std::uint16_t name_len = r.u16(at + 28);
    const std::uint16_t extra_len = r.u16(at + 30);
    const std::uint16_t comment_len = r.u16(at + 32);
    const std::uint32_t local_at = r.u32(at + 42);
    const auto name_bytes = r.slice(at + kCentralHeaderLen, name_len);
    std::string name(name_bytes.begin(), name_bytes.end());
    at += kCentralHeaderLen + name_len + extra_len + comment_len;

    if (flags & kFlagCrypt) {
      throw CorruptArchive("zip: encrypted entry '" + name + "'");
    }
    if (name.empty() || name.back() == '/') {
      continue; // directory entry
    }
    if (!seen.insert(name).second) {
      throw CorruptArchive("zip: duplicate entry '" + name + "'");
    }

    if (r.u32(local_at) != kLocalSig) {
      throw CorruptArchive("zip: bad local header for '" + name + "'");
    }
    const std::size_t data_at =
        local_at + kLocalHeaderLen + r.u16(local_at + 26) + r.u16(local_at + 28);
    const auto packed = r.slice(data_at, csize);

    std::vector<std::uint8_t> data;
    if (method == kStored) {
      if (csize != usize) {
        throw CorruptArchive("zip: size mismatch in stored entry '" + name + "'");
      }
      data.assign(packed.begin(), packed.end());
    } else if (method == kDeflated) {
      try {
        data = fs::inflate_raw(packed, usize);
      } catch (const std::runtime_error &e) {
        throw CorruptArchive("zip: entry '" + name + "': " + e.what());
      }
    } else {
      throw CorruptArchive("zip: unsupported compression method " + std::to_string(method) +
                           " for '" + name + "'");
    }
    if (fs::crc32(data) != crc) {
      throw CorruptArchive("zip: CRC mismatch for '" + name + "'");
    }
    entries.push_back(Entry{.name = std::move(name), .data = std::move(data)});
  }
  return entries;
}

} // namespace scidata::archive
