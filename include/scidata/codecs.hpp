#pragma once

#include "scidata/codec.hpp"

namespace scidata {

// Structured text (.json). Hashes the compact dump, so indentation and
// key order in the stored file do not change the digest.
class JsonCodec final : public Codec {
public:
  [[nodiscard]] std::string_view name() const override { return "json"; }
  [[nodiscard]] bool accepts(const Value &value) const override { return value.is_json(); }
  [[nodiscard]] Bytes encode(const Value &value) const override;
  [[nodiscard]] Value decode(std::span<const std::uint8_t> bytes) const override;
  [[nodiscard]] std::string hash(std::span<const std::uint8_t> bytes) const override;
};

// UTF-8 text (.txt, .log, .pgm)
class TextCodec final : public Codec {
public:
  [[nodiscard]] std::string_view name() const override { return "text"; }
  [[nodiscard]] bool accepts(const Value &value) const override { return value.is_text(); }
  [[nodiscard]] Bytes encode(const Value &value) const override;
  [[nodiscard]] Value decode(std::span<const std::uint8_t> bytes) const override;
};

// Raw bytes (.bin)
class BinaryCodec final : public Codec {
public:
  [[nodiscard]] std::string_view name() const override { return "binary"; }
  [[nodiscard]] bool accepts(const Value &value) const override { return value.is_bytes(); }
  [[nodiscard]] Bytes encode(const Value &value) const override { return value.as_bytes(); }
  [[nodiscard]] Value decode(std::span<const std::uint8_t> bytes) const override {
    return Bytes(bytes.begin(), bytes.end());
  }
};

// NumPy .npy, format version 1.0, C order, little-endian or byte-sized dtypes.
class NpyCodec final : public Codec {
public:
  [[nodiscard]] std::string_view name() const override { return "npy"; }
  [[nodiscard]] bool accepts(const Value &value) const override { return value.is_array(); }
  [[nodiscard]] Bytes encode(const Value &value) const override;
  [[nodiscard]] Value decode(std::span<const std::uint8_t> bytes) const override;
};

// Element size for a NumPy type string ("<f8" -> 8); 0 if unsupported.
std::size_t dtype_size(std::string_view dtype);

// Register json, txt (+log, pgm), bin and npy.
void register_builtin_codecs(CodecRegistry &registry);

} // namespace scidata
