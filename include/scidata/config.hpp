#pragma once
#include <filesystem>
#include <string>

namespace scidata {

struct Identity {
  std::string name;
  std::string email;
};

// Fallback values consulted only where a container or call leaves the
// corresponding field empty.
struct Defaults {
  Identity identity;
  std::string server; // store endpoint: "tcp://host:port" or a directory
  std::string key;    // credential token for the store
};

// Read defaults from a "key: value" file (empty fields if missing)
Defaults load_defaults(const std::filesystem::path &path);

// Overwrite the file with the given defaults
void save_defaults(const std::filesystem::path &path, const Defaults &defaults);

} // namespace scidata
