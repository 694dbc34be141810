#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scidata {

using Json  = nlohmann::json;
using Bytes = std::vector<std::uint8_t>;

enum class ValueKind : std::uint8_t {
  Json = 0,  // structured data
  Text = 1,  // UTF-8 text
  Bytes = 2, // raw binary
  Array = 3, // n-dimensional numeric array
};

std::string_view kind_name(ValueKind kind);

// Dense numeric array in C order. `dtype` uses the NumPy type-string form
// with explicit byte order, e.g. "<f8", "<i4", "|u1".
struct NdArray {
  std::string dtype;
  std::vector<std::size_t> shape;
  Bytes data;

  bool operator==(const NdArray &) const = default;
};

/**
 * A decoded item payload.
 *
 * Holds its data by value: copying a Value copies the payload, so a value
 * handed to a container can never be altered through the caller's copy.
 */
class Value {
public:
  Value() = default; // JSON null
  Value(Json j) : v_(std::move(j)) {}
  Value(std::string text) : v_(std::move(text)) {}
  Value(const char *text) : v_(std::string(text)) {}
  Value(Bytes bytes) : v_(std::move(bytes)) {}
  Value(NdArray array) : v_(std::move(array)) {}

  [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(v_.index()); }

  [[nodiscard]] bool is_json() const { return kind() == ValueKind::Json; }
  [[nodiscard]] bool is_text() const { return kind() == ValueKind::Text; }
  [[nodiscard]] bool is_bytes() const { return kind() == ValueKind::Bytes; }
  [[nodiscard]] bool is_array() const { return kind() == ValueKind::Array; }

  // Accessors throw UnsupportedFormat when the kind does not match.
  [[nodiscard]] const Json &as_json() const;
  [[nodiscard]] const std::string &as_text() const;
  [[nodiscard]] const Bytes &as_bytes() const;
  [[nodiscard]] const NdArray &as_array() const;

  bool operator==(const Value &other) const { return v_ == other.v_; }

private:
  std::variant<Json, std::string, Bytes, NdArray> v_;
};

} // namespace scidata
