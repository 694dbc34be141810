#include "scidata/archive.hpp"
#include "scidata/errors.hpp"
#include "scidata/fs.hpp"

#include <algorithm>
#include <iostream>
#include <string>

using namespace scidata;

static std::vector<std::uint8_t> bytes_of(std::string_view s) { return {s.begin(), s.end()}; }

int main() {
  try {
    const std::string big(5000, 'x'); // compresses well
    const std::vector<archive::Entry> entries{
        {.name = "content.json", .data = bytes_of("{\"a\": 1}")},
        {.name = "sim/big.txt", .data = bytes_of(big)},
        {.name = "empty.bin", .data = {}},
        {.name = "sim/raw.bin", .data = {0x00, 0xff, 0x10}},
    };

    const auto zip = archive::write_zip(entries, 1700000000);
    if (zip.size() < 4 || zip[0] != 'P' || zip[1] != 'K') { std::cerr << "missing zip signature\n"; return 1; }
    if (zip.size() >= big.size()) { std::cerr << "large entry was not deflated\n"; return 1; }

    const auto back = archive::read_zip(zip);
    if (back.size() != entries.size()) { std::cerr << "entry count\n"; return 1; }
    for (std::size_t i = 0; i < entries.size(); ++i) {
      if (back[i].name != entries[i].name || back[i].data != entries[i].data) {
        std::cerr << "entry mismatch: " << entries[i].name << "\n"; return 1;
      }
    }

    // Same input, same bytes
    if (archive::write_zip(entries, 1700000000) != zip) { std::cerr << "not deterministic\n"; return 1; }

    // Damaged data
    auto corrupt = [](std::vector<std::uint8_t> b) {
      try {
        (void)archive::read_zip(b);
      } catch (const CorruptArchive &) {
        return true;
      }
      return false;
    };
    if (!corrupt(bytes_of("not a zip at all"))) { std::cerr << "garbage accepted\n"; return 1; }
    if (!corrupt({})) { std::cerr << "empty accepted\n"; return 1; }
    {
      auto cut = zip;
      cut.resize(zip.size() / 2);
      if (!corrupt(cut)) { std::cerr << "truncated archive accepted\n"; return 1; }
    }
    {
      // flip one byte of the stored sim/raw.bin payload
      auto flipped = zip;
      const std::string needle = "sim/raw.bin";
      auto it = std::search(flipped.begin(), flipped.end(), needle.begin(), needle.end());
      if (it == flipped.end()) { std::cerr << "entry name not found\n"; return 1; }
      *(it + static_cast<std::ptrdiff_t>(needle.size()) + 1) ^= 0x5a;
      if (!corrupt(flipped)) { std::cerr << "crc mismatch accepted\n"; return 1; }
    }
    {
      // central directory claims a 4 GiB uncompressed size for sim/big.txt
      auto inflated = zip;
      const std::string needle = "sim/big.txt";
      auto local = std::search(inflated.begin(), inflated.end(), needle.begin(), needle.end());
      auto central = std::search(local + 1, inflated.end(), needle.begin(), needle.end());
      if (central == inflated.end()) { std::cerr << "central entry not found\n"; return 1; }
      std::fill(central - 22, central - 18, std::uint8_t{0xff});
      if (!corrupt(inflated)) { std::cerr << "oversized entry accepted\n"; return 1; }

      bool rejected = false;
      try {
        (void)fs::inflate_raw(fs::deflate_raw(bytes_of(big)), std::size_t{1} << 32);
      } catch (const std::runtime_error &) {
        rejected = true;
      }
      if (!rejected) { std::cerr << "inflate trusted an impossible size\n"; return 1; }
    }
    {
      const std::vector<archive::Entry> dup{{.name = "a.txt", .data = bytes_of("1")},
                                            {.name = "a.txt", .data = bytes_of("2")}};
      if (!corrupt(archive::write_zip(dup, 1700000000))) { std::cerr << "duplicate names accepted\n"; return 1; }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "archive OK\n";
  return 0;
}
