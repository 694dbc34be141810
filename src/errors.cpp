#include "scidata/errors.hpp"

#include <array>
#include <utility>

namespace scidata {

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 10> kKindNames{{
    {ErrorKind::SchemaViolation, "SchemaViolation"},
    {ErrorKind::InvalidName, "InvalidName"},
    {ErrorKind::ImmutableContainer, "ImmutableContainer"},
    {ErrorKind::UnsupportedFormat, "UnsupportedFormat"},
    {ErrorKind::NotFound, "NotFound"},
    {ErrorKind::StaleWrite, "StaleWrite"},
    {ErrorKind::ImmutableRemote, "ImmutableRemote"},
    {ErrorKind::NotOwner, "NotOwner"},
    {ErrorKind::AlreadyStatic, "AlreadyStatic"},
    {ErrorKind::CorruptArchive, "CorruptArchive"},
}};

} // namespace

std::string_view kind_name(ErrorKind kind) {
  for (const auto &[k, name] : kKindNames) {
    if (k == kind) {
      return name;
    }
  }
  return "Unknown";
}

bool parse_kind(std::string_view name, ErrorKind &out) {
  for (const auto &[k, n] : kKindNames) {
    if (n == name) {
      out = k;
      return true;
    }
  }
  return false;
}

void raise(ErrorKind kind, const std::string &msg) {
  switch (kind) {
  case ErrorKind::SchemaViolation:
    throw SchemaViolation(msg);
  case ErrorKind::InvalidName:
    throw InvalidName(msg);
  case ErrorKind::ImmutableContainer:
    throw ImmutableContainer(msg);
  case ErrorKind::UnsupportedFormat:
    throw UnsupportedFormat(msg);
  case ErrorKind::NotFound:
    throw NotFound(msg);
  case ErrorKind::StaleWrite:
    throw StaleWrite(msg);
  case ErrorKind::ImmutableRemote:
    throw ImmutableRemote(msg);
  case ErrorKind::NotOwner:
    throw NotOwner(msg);
  case ErrorKind::AlreadyStatic:
    throw AlreadyStatic(msg);
  case ErrorKind::CorruptArchive:
    throw CorruptArchive(msg);
  }
  throw Error(kind, msg);
}

} // namespace scidata
