#pragma once
#include <string>
#include <string_view>

namespace scidata {

// Validate 64-char lowercase/uppercase hex (SHA-256 digest)
auto looks_hex64(std::string_view str) -> bool;

// Random RFC4122 version-4 identifier, "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx".
auto generate_uuid() -> std::string;

// Canonical 8-4-4-4-12 hex form (any version).
auto looks_uuid(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading/trailing spaces, tabs and CR
  auto trim(std::string_view sv) -> std::string;

  auto has_whitespace(std::string_view sv) -> bool;
}

}
