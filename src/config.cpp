#include "scidata/config.hpp"

#include "scidata/fs.hpp"
#include "scidata/util.hpp"

#include <sstream>
#include <string_view>

namespace scidata {

auto load_defaults(const std::filesystem::path &path) -> Defaults {
  Defaults out{};
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_author = "author:";
  constexpr std::string_view k_email = "email:";
  constexpr std::string_view k_server = "server:";
  constexpr std::string_view k_key = "key:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_author)) {
      out.identity.name = strutil::trim(sv.substr(k_author.size()));
    } else if (sv.starts_with(k_email)) {
      out.identity.email = strutil::trim(sv.substr(k_email.size()));
    } else if (sv.starts_with(k_server)) {
      out.server = strutil::trim(sv.substr(k_server.size()));
    } else if (sv.starts_with(k_key)) {
      out.key = strutil::trim(sv.substr(k_key.size()));
    }
  }
  return out;
}

void save_defaults(const std::filesystem::path &path, const Defaults &d) {
  std::ostringstream os;
  os << "author: " << d.identity.name << '\n' << "email: " << d.identity.email << '\n';
  if (!d.server.empty())
    os << "server: " << d.server << '\n';
  if (!d.key.empty())
    os << "key: " << d.key << '\n';
  fs::write_file_atomic(path, os.str());
}

} // namespace scidata
