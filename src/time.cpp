#include "scidata/time.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
#endif

namespace {

bool read_int(std::string_view s, std::size_t pos, std::size_t len, int &out) {
  if (pos + len > s.size())
    return false;
  const char *first = s.data() + pos;
  const char *last = first + len;
  for (const char *p = first; p != last; ++p) {
    if (*p < '0' || *p > '9')
      return false;
  }
  return std::from_chars(first, last, out).ec == std::errc{};
}

} // namespace

namespace scidata::timeutil {

std::time_t now_utc() {
  return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, hh, mm);
  return std::string(buf);
}

std::string format_timestamp(std::time_t when) {
  std::tm gt{};
#if defined(_WIN32)
  gmtime_s(&gt, &when);
#else
  gmtime_r(&when, &gt);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", gt.tm_year + 1900,
                gt.tm_mon + 1, gt.tm_mday, gt.tm_hour, gt.tm_min, gt.tm_sec);
  return std::string(buf) + tz_offset_string(0);
}

bool parse_timestamp(std::string_view s, std::time_t &out) {
  // 0123456789012345678
  // YYYY-MM-DDTHH:MM:SS
  if (s.size() < 20 || s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != ' ') ||
      s[13] != ':' || s[16] != ':')
    return false;

  std::tm t{};
  int year = 0, mon = 0;
  if (!read_int(s, 0, 4, year) || !read_int(s, 5, 2, mon) || !read_int(s, 8, 2, t.tm_mday) ||
      !read_int(s, 11, 2, t.tm_hour) || !read_int(s, 14, 2, t.tm_min) ||
      !read_int(s, 17, 2, t.tm_sec))
    return false;
  if (mon < 1 || mon > 12 || t.tm_mday < 1 || t.tm_mday > 31 || t.tm_hour > 23 ||
      t.tm_min > 59 || t.tm_sec > 60)
    return false;
  t.tm_year = year - 1900;
  t.tm_mon = mon - 1;

  std::string_view zone = s.substr(19);
  int offset_minutes = 0;
  if (zone == "Z") {
    offset_minutes = 0;
  } else if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
    int hh = 0, mm = 0;
    if (!read_int(zone, 1, 2, hh) || !read_int(zone, 4, 2, mm) || hh > 23 || mm > 59)
      return false;
    offset_minutes = hh * 60 + mm;
    if (zone[0] == '-')
      offset_minutes = -offset_minutes;
  } else {
    return false;
  }

  out = timegm_portable(&t) - static_cast<std::time_t>(offset_minutes) * 60;
  return true;
}

} // namespace scidata::timeutil
