// Utility helpers for hex, identifiers and strings
#include "scidata/util.hpp"

#include "scidata/consts.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace scidata {

bool looks_hex64(std::string_view str) {
  if (str.size() != consts::kDigestHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string generate_uuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<std::uint8_t, 16> id{};
  for (auto &b : id)
    b = static_cast<std::uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string s;
  s.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      s.push_back('-');
    s.push_back(kHex[(id[i] >> 4) & 0x0F]);
    s.push_back(kHex[id[i] & 0x0F]);
  }
  return s;
}

bool looks_uuid(std::string_view str) {
  if (str.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-')
        return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
      return false;
    }
  }
  return true;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

bool has_whitespace(std::string_view sv) {
  return std::ranges::any_of(sv, [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

} // namespace strutil

} // namespace scidata
