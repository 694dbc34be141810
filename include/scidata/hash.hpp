#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // EVP_MD_CTX

namespace scidata {

// Raw 32-byte SHA-256 digest (binary, not hex)
using digest = std::array<std::uint8_t, 32>;

/** Compute SHA-256 of arbitrary bytes. */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Incremental SHA-256 for digests fed piecewise (the container digest
 * streams one record per item).
 */
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }

  // Finish and return the digest. The object cannot be updated afterwards.
  digest finish();

private:
  evp_md_ctx_st *ctx_;
  bool finished_{false};
};

/** Convert binary digest to 64-char lowercase hex. */
std::string to_hex(const digest &id);

/**
 * Parse 64-char hex into binary digest.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, digest &out);

} // namespace scidata
