#include "scidata/codecs.hpp"
#include "scidata/errors.hpp"

#include <atomic>
#include <cctype>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace scidata;

template <class E, class F> static bool throws(F &&f) {
  try {
    f();
  } catch (const E &) {
    return true;
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
  }
  return false;
}

namespace {

// Uppercases text on encode.
class UpperTextCodec final : public Codec {
public:
  [[nodiscard]] std::string_view name() const override { return "upper"; }
  [[nodiscard]] bool accepts(const Value &v) const override { return v.is_text(); }
  [[nodiscard]] Bytes encode(const Value &v) const override {
    std::string s = v.as_text();
    for (char &c : s)
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return Bytes(s.begin(), s.end());
  }
  [[nodiscard]] Value decode(std::span<const std::uint8_t> b) const override {
    return std::string(b.begin(), b.end());
  }
};

} // namespace

int main() {
  try {
    CodecRegistry reg;
    register_builtin_codecs(reg);

    for (const char *ext : {"json", "txt", "log", "pgm", "bin", "npy"}) {
      if (!reg.contains(ext)) { std::cerr << "missing builtin codec " << ext << "\n"; return 1; }
    }
    if (reg.find("log") != reg.find("txt")) { std::cerr << "alias should share converter\n"; return 1; }
    if (reg.contains("png")) { std::cerr << "no image codec expected\n"; return 1; }

    // JSON
    const Json doc = {{"b", 1}, {"a", {2, 5, 1}}};
    auto bytes = reg.encode("json", doc);
    if (reg.decode("json", bytes).as_json() != doc) { std::cerr << "json roundtrip\n"; return 1; }
    {
      auto codec = reg.find("json");
      const std::string compact = R"({"a":[2,5,1],"b":1})";
      const std::string pretty = "{\n  \"b\": 1,\n  \"a\": [2, 5, 1]\n}\n";
      auto h1 = codec->hash(Bytes(compact.begin(), compact.end()));
      auto h2 = codec->hash(Bytes(pretty.begin(), pretty.end()));
      if (h1 != h2) { std::cerr << "json hash depends on formatting\n"; return 1; }
      if (!throws<CorruptArchive>([&] { (void)reg.decode("json", Bytes{'{', 'x'}); })) {
        std::cerr << "bad json should be CorruptArchive\n"; return 1;
      }
    }

    // Text / binary
    if (reg.decode("log", reg.encode("log", "hello\n")).as_text() != "hello\n") {
      std::cerr << "text roundtrip\n"; return 1;
    }
    const Bytes raw{0, 1, 2, 255};
    if (reg.decode("bin", reg.encode("bin", raw)).as_bytes() != raw) { std::cerr << "bin roundtrip\n"; return 1; }

    // Wrong kind for a known extension
    if (!throws<UnsupportedFormat>([&] { (void)reg.encode("txt", Json{1, 2}); })) {
      std::cerr << "json into .txt should fail\n"; return 1;
    }

    // NumPy: 2x3 float64
    {
      NdArray a{.dtype = "<f8", .shape = {2, 3}, .data = {}};
      for (int i = 0; i < 6; ++i) {
        double d = i * 0.5;
        std::uint8_t buf[8];
        std::memcpy(buf, &d, 8);
        a.data.insert(a.data.end(), buf, buf + 8);
      }
      auto enc = reg.encode("npy", a);
      if ((enc.size() - 48) % 64 != 0) { std::cerr << "npy header not padded to 64 (" << enc.size() << ")\n"; return 1; }
      if (reg.decode("npy", enc).as_array() != a) { std::cerr << "npy roundtrip\n"; return 1; }

      NdArray bad{.dtype = "<f8", .shape = {4}, .data = Bytes(8)};
      if (!throws<UnsupportedFormat>([&] { (void)reg.encode("npy", bad); })) {
        std::cerr << "npy size mismatch should fail\n"; return 1;
      }
      if (dtype_size("<i4") != 4 || dtype_size("|u1") != 1 || dtype_size(">f8") != 0 || dtype_size("<U8") != 0) {
        std::cerr << "dtype_size\n"; return 1;
      }
    }

    // Unknown extension: kind default
    {
      auto e = reg.encode_with("dat", Value(std::string("abc")));
      if (e.codec != reg.find("txt")) { std::cerr << "text default not used\n"; return 1; }
      auto j = reg.encode_with("cfg", Value(Json{{"k", 1}}));
      if (j.codec != reg.find("json")) { std::cerr << "json default not used\n"; return 1; }
    }

    // Later registration overrides the text default, never the json default
    {
      CodecRegistry r2;
      register_builtin_codecs(r2);
      auto upper = std::make_shared<UpperTextCodec>();
      r2.register_codec("up", upper, ValueKind::Text);
      r2.register_codec("js2", std::make_shared<JsonCodec>(), ValueKind::Json);
      if (r2.default_for(ValueKind::Text) != upper) { std::cerr << "text default not overridden\n"; return 1; }
      if (r2.default_for(ValueKind::Json) != r2.find("json")) { std::cerr << "json default changed\n"; return 1; }
      auto out = r2.encode("unknown", "abc");
      if (std::string(out.begin(), out.end()) != "ABC") { std::cerr << "override default not used\n"; return 1; }
    }

    // Nothing can take the value
    {
      CodecRegistry empty;
      if (!throws<UnsupportedFormat>([&] { (void)empty.encode("x", "abc"); })) {
        std::cerr << "empty registry should fail\n"; return 1;
      }
      if (!throws<UnsupportedFormat>([&] { (void)empty.decode("x", Bytes{}); })) {
        std::cerr << "decode without codec should fail\n"; return 1;
      }
      if (!throws<UnsupportedFormat>([&] { empty.register_alias("log", "txt"); })) {
        std::cerr << "alias of unknown ext should fail\n"; return 1;
      }
    }

    // Registration from several threads while others look up and encode
    {
      CodecRegistry shared;
      register_builtin_codecs(shared);
      auto upper = std::make_shared<UpperTextCodec>();
      constexpr int kWriters = 4;
      constexpr int kPerWriter = 50;
      std::atomic<bool> done{false};
      std::atomic<int> failures{0};

      std::vector<std::thread> readers;
      for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
          try {
            while (!done.load()) {
              if (!shared.find("json") || shared.find("json") != shared.default_for(ValueKind::Json)) {
                ++failures;
              }
              const auto out = shared.encode("txt", "abc");
              if (std::string(out.begin(), out.end()) != "abc") {
                ++failures;
              }
              (void)shared.extensions();
            }
          } catch (const std::exception &e) {
            std::cerr << "reader: " << e.what() << "\n";
            ++failures;
          }
        });
      }

      std::vector<std::thread> writers;
      for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
          try {
            for (int i = 0; i < kPerWriter; ++i) {
              const std::string ext = "w" + std::to_string(w) + "x" + std::to_string(i);
              shared.register_codec(ext, upper);
              shared.register_alias("a" + ext, ext);
            }
          } catch (const std::exception &e) {
            std::cerr << "writer: " << e.what() << "\n";
            ++failures;
          }
        });
      }
      for (auto &t : writers) {
        t.join();
      }
      done.store(true);
      for (auto &t : readers) {
        t.join();
      }

      if (failures.load() != 0) { std::cerr << "concurrent registry access failed\n"; return 1; }
      if (shared.extensions().size() != static_cast<std::size_t>(6 + 2 * kWriters * kPerWriter)) {
        std::cerr << "registrations lost: " << shared.extensions().size() << "\n"; return 1;
      }
      for (int w = 0; w < kWriters; ++w) {
        for (int i = 0; i < kPerWriter; ++i) {
          const std::string ext = "w" + std::to_string(w) + "x" + std::to_string(i);
          if (shared.find(ext) != upper || shared.find("a" + ext) != upper) {
            std::cerr << "wrong converter for " << ext << "\n"; return 1;
          }
        }
      }
      auto out = shared.encode("aw3x49", "abc");
      if (std::string(out.begin(), out.end()) != "ABC") { std::cerr << "alias after concurrent registration\n"; return 1; }
    }

    if (extension_of("a/b.c/d.json") != "json" || !extension_of("noext").empty()) {
      std::cerr << "extension_of\n"; return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "codecs OK\n";
  return 0;
}
