#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace scidata::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Write to "<p>.tmp" and rename over `p`. The temporary is removed on failure,
// so `p` is either the old file or the complete new one.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

inline void write_file_atomic(const std::filesystem::path& p, const std::string& text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

// Raw deflate streams (no zlib header), as stored in ZIP entries.
// inflate_raw rejects an expected_size the input could never expand to.
std::vector<std::uint8_t> deflate_raw(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> inflate_raw(std::span<const std::uint8_t> data, std::size_t expected_size);

std::uint32_t crc32(std::span<const std::uint8_t> data);

} // namespace scidata::fs
