#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace scidata {

/*
  Error taxonomy.

  Every failure the library reports is one of these. The kind survives the
  store protocol: the server sends "ERR <Kind> <message>" and the client
  rethrows the same type via raise().
*/

enum class ErrorKind {
  SchemaViolation,
  InvalidName,
  ImmutableContainer,
  UnsupportedFormat,
  NotFound,
  StaleWrite,
  ImmutableRemote,
  NotOwner,
  AlreadyStatic,
  CorruptArchive,
};

std::string_view kind_name(ErrorKind kind);

// Returns false for an unknown name.
bool parse_kind(std::string_view name, ErrorKind &out);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

#define SCIDATA_DEFINE_ERROR(Name)                                                                \
  class Name : public Error {                                                                     \
  public:                                                                                         \
    explicit Name(const std::string &msg) : Error(ErrorKind::Name, msg) {}                        \
  };

SCIDATA_DEFINE_ERROR(SchemaViolation)
SCIDATA_DEFINE_ERROR(InvalidName)
SCIDATA_DEFINE_ERROR(ImmutableContainer)
SCIDATA_DEFINE_ERROR(UnsupportedFormat)
SCIDATA_DEFINE_ERROR(NotFound)
SCIDATA_DEFINE_ERROR(StaleWrite)
SCIDATA_DEFINE_ERROR(ImmutableRemote)
SCIDATA_DEFINE_ERROR(NotOwner)
SCIDATA_DEFINE_ERROR(AlreadyStatic)
SCIDATA_DEFINE_ERROR(CorruptArchive)

#undef SCIDATA_DEFINE_ERROR

// Throw the typed exception matching `kind`.
[[noreturn]] void raise(ErrorKind kind, const std::string &msg);

} // namespace scidata
