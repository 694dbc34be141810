#include "scidata/codecs.hpp"
#include "scidata/config.hpp"
#include "scidata/container.hpp"
#include "scidata/fs.hpp"
#include "scidata/logging.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace stdfs = std::filesystem;
using namespace scidata;

int main() {
  const stdfs::path dir = stdfs::temp_directory_path() / ("scidata_config_" + std::to_string(std::random_device{}()));
  stdfs::create_directories(dir);

  try {
    logging::InitializeLogging("debug");
    SCIDATA_LOG_DEBUG("config test starting", {logging::StringField("dir", dir.string()),
                                               logging::IntField("pid_hint", 1),
                                               logging::BoolField("debug", true)});

    // Missing file: empty defaults
    Defaults none = load_defaults(dir / "absent");
    if (!none.identity.name.empty() || !none.server.empty()) { std::cerr << "missing file should give empty defaults\n"; return 1; }

    Defaults d;
    d.identity = {"Ada Lovelace", "ada@example.org"};
    d.server = "tcp://store.example.org:9419";
    d.key = "s3cret";
    save_defaults(dir / "defaults", d);

    Defaults back = load_defaults(dir / "defaults");
    if (back.identity.name != d.identity.name || back.identity.email != d.identity.email ||
        back.server != d.server || back.key != d.key) {
      std::cerr << "defaults roundtrip\n"; return 1;
    }

    // Comments and surrounding whitespace
    fs::write_file_atomic(dir / "hand", std::string("# user defaults\nauthor:   Grace  \nemail:\tg@h.org\n"));
    Defaults hand = load_defaults(dir / "hand");
    if (hand.identity.name != "Grace" || hand.identity.email != "g@h.org" || !hand.key.empty()) {
      std::cerr << "hand-written defaults: '" << hand.identity.name << "'\n"; return 1;
    }

    // Defaults fill an anonymous container's author and email
    CodecRegistry reg;
    register_builtin_codecs(reg);
    Container c(Payload{{"content.json", Json{{"containerType", {{"name", "demo"}}}}},
                        {"meta.json", Json{{"title", "T"}}}},
                reg, back);
    if (c.meta().author != "Ada Lovelace" || c.meta().email != "ada@example.org") {
      std::cerr << "identity defaults not applied\n"; return 1;
    }
    logging::ShutdownLogging();
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    stdfs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  stdfs::remove_all(dir, ec);
  std::cout << "config OK\n";
  return 0;
}
