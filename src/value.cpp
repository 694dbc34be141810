#include "scidata/value.hpp"

#include "scidata/errors.hpp"

namespace scidata {

namespace {

[[noreturn]] void wrong_kind(ValueKind want, ValueKind have) {
  throw UnsupportedFormat("value is " + std::string(kind_name(have)) + ", not " +
                          std::string(kind_name(want)));
}

} // namespace

std::string_view kind_name(ValueKind kind) {
  switch (kind) {
  case ValueKind::Json:
    return "json";
  case ValueKind::Text:
    return "text";
  case ValueKind::Bytes:
    return "bytes";
  case ValueKind::Array:
    return "array";
  }
  return "unknown";
}

const Json &Value::as_json() const {
  if (const auto *p = std::get_if<Json>(&v_))
    return *p;
  wrong_kind(ValueKind::Json, kind());
}

const std::string &Value::as_text() const {
  if (const auto *p = std::get_if<std::string>(&v_))
    return *p;
  wrong_kind(ValueKind::Text, kind());
}

const Bytes &Value::as_bytes() const {
  if (const auto *p = std::get_if<Bytes>(&v_))
    return *p;
  wrong_kind(ValueKind::Bytes, kind());
}

const NdArray &Value::as_array() const {
  if (const auto *p = std::get_if<NdArray>(&v_))
    return *p;
  wrong_kind(ValueKind::Array, kind());
}

} // namespace scidata
