#pragma once

#include "scidata/value.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scidata {

/**
 * Bidirectional converter between a typed Value and the byte stream stored
 * in an archive entry.
 *
 * hash() must map semantically equal payloads to the same digest; the
 * default is the SHA-256 hex of the encoded bytes.
 */
class Codec {
public:
  virtual ~Codec() = default;

  // Short format label used in logs, e.g. "json".
  [[nodiscard]] virtual std::string_view name() const = 0;

  [[nodiscard]] virtual bool accepts(const Value &value) const = 0;

  [[nodiscard]] virtual Bytes encode(const Value &value) const = 0;
  [[nodiscard]] virtual Value decode(std::span<const std::uint8_t> bytes) const = 0;

  [[nodiscard]] virtual std::string hash(std::span<const std::uint8_t> bytes) const;
};

using CodecPtr = std::shared_ptr<const Codec>;

/**
 * Extension -> converter table plus a per-kind default table.
 *
 * Populate at startup, read-mostly afterwards. Registration takes the writer
 * lock, lookups a shared lock, so concurrent registration is serialized and
 * concurrent lookups never block each other.
 *
 * Extensions are given without the dot ("json", "txt").
 */
class CodecRegistry {
public:
  CodecRegistry() = default;

  CodecRegistry(const CodecRegistry &) = delete;
  CodecRegistry &operator=(const CodecRegistry &) = delete;

  // Map `ext` to `codec`. With `default_for`, the codec also becomes the
  // default converter for that value kind. The JSON default is fixed once set.
  void register_codec(const std::string &ext, CodecPtr codec,
                      std::optional<ValueKind> default_for = std::nullopt);

  // Reuse the converter already registered for `existing_ext`.
  void register_alias(const std::string &ext, const std::string &existing_ext);

  [[nodiscard]] bool contains(std::string_view ext) const;
  [[nodiscard]] std::vector<std::string> extensions() const;

  // Converter registered for `ext`, or nullptr.
  [[nodiscard]] CodecPtr find(std::string_view ext) const;

  // Default converter for `kind`, or nullptr.
  [[nodiscard]] CodecPtr default_for(ValueKind kind) const;

  [[nodiscard]] Bytes encode(std::string_view ext, const Value &value) const;
  [[nodiscard]] Value decode(std::string_view ext, std::span<const std::uint8_t> bytes) const;

  // Encode `value` and return {codec, bytes}; unknown extensions try every
  // candidate converter in turn and keep the first that succeeds.
  struct Encoded {
    CodecPtr codec;
    Bytes bytes;
  };
  [[nodiscard]] Encoded encode_with(std::string_view ext, const Value &value) const;

private:
  mutable std::shared_mutex mu_;
  std::map<std::string, CodecPtr, std::less<>> by_ext_;
  std::map<ValueKind, CodecPtr> defaults_;
  std::vector<CodecPtr> formats_; // distinct converters in registration order
};

// Extension of a qualified item name without the dot ("x/y.json" -> "json").
std::string_view extension_of(std::string_view item_name);

} // namespace scidata
