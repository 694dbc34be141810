#pragma once
#include <ctime>
#include <string>
#include <string_view>

namespace scidata::timeutil {

// Current UTC time, one-second resolution.
auto now_utc() -> std::time_t;

// Format ±HH:MM from minutes (e.g., +180 -> "+03:00", -420 -> "-07:00")
auto tz_offset_string(int minutes) -> std::string;

// "2023-05-01T12:34:56+00:00"
auto format_timestamp(std::time_t when) -> std::string;

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by "Z" or "±HH:MM" and normalizes to
// UTC. Returns false if the text is not such a timestamp.
auto parse_timestamp(std::string_view text, std::time_t &out) -> bool;

} // namespace scidata::timeutil
