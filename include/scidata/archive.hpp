#pragma once

#include <cstdint>
#include <ctime>
#include <span>
#include <string>
#include <vector>

namespace scidata::archive {

struct Entry {
  std::string name;               // "part/name.ext", root entries unprefixed
  std::vector<std::uint8_t> data; // uncompressed bytes
};

/**
 * Build a ZIP package from `entries` in the given order.
 * Entries are deflated unless deflate does not shrink them; every entry
 * carries `when` as its modification time so equal input gives equal bytes.
 */
std::vector<std::uint8_t> write_zip(const std::vector<Entry>& entries, std::time_t when);

/**
 * Parse a ZIP package. Throws CorruptArchive for anything unreadable: bad
 * signatures, truncation, CRC mismatch, encryption, duplicate names.
 * Directory entries are skipped.
 */
std::vector<Entry> read_zip(std::span<const std::uint8_t> bytes);

} // namespace scidata::archive
