#include "scidata/codecs.hpp"
#include "scidata/errors.hpp"
#include "scidata/remote.hpp"
#include "scidata/sync.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace stdfs = std::filesystem;
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

static const std::string kU1 = "11111111-1111-4111-8111-111111111111";
static const std::string kU2 = "22222222-2222-4222-8222-222222222222";
static const std::string kU3 = "33333333-3333-4333-8333-333333333333";
static const std::string kU4 = "44444444-4444-4444-8444-444444444444";

static Payload payload(const std::string &uuid, const std::string &modified, bool complete,
                       int roll, const std::string &replaces = {}) {
  Json content = {{"uuid", uuid},
                  {"containerType", {{"name", "dice"}}},
                  {"modified", modified},
                  {"complete", complete}};
  if (!replaces.empty()) {
    content["replaces"] = replaces;
  }
  return Payload{{"content.json", content},
                 {"meta.json", Json{{"author", "A"}, {"email", "a@x"}, {"title", "Rolls"}}},
                 {"sim/dice.json", Json{roll}}};
}

static Payload static_payload() {
  return Payload{{"content.json", Json{{"containerType", {{"name", "calibration"}}}}},
                 {"meta.json", Json{{"author", "A"}, {"email", "a@x"}, {"title", "Cal"}}},
                 {"cal/table.json", Json{{"gain", 1.5}, {"offset", -2}}}};
}

static std::size_t record_count(const stdfs::path &root) {
  std::size_t n = 0;
  for (const auto &e : stdfs::directory_iterator(root / "records")) {
    n += e.is_regular_file() ? 1 : 0;
  }
  return n;
}

int main() {
  const stdfs::path root = stdfs::temp_directory_path() / ("scidata_store_" + std::to_string(std::random_device{}()));

  try {
    CodecRegistry reg;
    register_builtin_codecs(reg);
    FsRemoteStore store(root);
    const Credential alice{.token = "alice-token"};
    const Credential bob{.token = "bob-token"};

    // Multi-step uploads under one identifier
    {
      Container c1(payload(kU1, "2024-01-01T00:00:00Z", false, 1), reg);
      auto r1 = upload(c1, store, alice);
      if (r1.outcome != UploadOutcome::kCreated || r1.uuid != kU1) { std::cerr << "first upload\n"; return 1; }
      if (c1.is_mutable()) { std::cerr << "upload should seal\n"; return 1; }

      Container same(payload(kU1, "2024-01-01T00:00:00Z", false, 2), reg);
      if (!throws<StaleWrite>([&] { (void)upload(same, store, alice); })) { std::cerr << "equal modified accepted\n"; return 1; }
      Container older(payload(kU1, "2023-12-31T23:59:59Z", false, 2), reg);
      if (!throws<StaleWrite>([&] { (void)upload(older, store, alice); })) { std::cerr << "older modified accepted\n"; return 1; }

      Container other(payload(kU1, "2024-01-01T00:00:05Z", false, 9), reg);
      if (!throws<NotOwner>([&] { (void)upload(other, store, bob); })) { std::cerr << "foreign replace accepted\n"; return 1; }

      Container c2(payload(kU1, "2024-01-01T00:00:01Z", false, 2), reg);
      auto r2 = upload(c2, store, alice);
      if (r2.outcome != UploadOutcome::kReplaced) { std::cerr << "second upload not a replace\n"; return 1; }
      if (c2.content().created != c1.content().created) { std::cerr << "store should keep created\n"; return 1; }

      Container got = download(kU1, store, alice, reg);
      if (got.get("sim/dice.json").as_json() != Json{2}) { std::cerr << "remote not replaced\n"; return 1; }
      if (got.is_mutable()) { std::cerr << "downloaded container should be immutable\n"; return 1; }

      // Final step closes the entry
      Container c3(payload(kU1, "2024-01-01T00:00:02Z", true, 3), reg);
      (void)upload(c3, store, alice);
      Container c4(payload(kU1, "2024-01-01T00:00:03Z", true, 4), reg);
      if (!throws<ImmutableRemote>([&] { (void)upload(c4, store, alice); })) { std::cerr << "complete entry replaced\n"; return 1; }
    }

    // complete=true twice
    {
      Container c(payload(kU2, "2024-02-01T00:00:00Z", true, 6), reg);
      (void)upload(c, store, alice);
      if (!throws<ImmutableRemote>([&] { (void)upload(c, store, alice); })) { std::cerr << "second complete upload\n"; return 1; }
    }

    // Supersession via replaces
    {
      Container foreign(payload(kU3, "2024-03-01T00:00:00Z", true, 1, kU2), reg);
      if (!throws<NotOwner>([&] { (void)upload(foreign, store, bob); })) { std::cerr << "foreign supersede\n"; return 1; }

      Container next(payload(kU3, "2024-03-01T00:00:00Z", true, 7, kU2), reg);
      if (upload(next, store, alice).outcome != UploadOutcome::kCreated) { std::cerr << "supersede create\n"; return 1; }
      Container last(payload(kU4, "2024-03-02T00:00:00Z", true, 8, kU3), reg);
      (void)upload(last, store, alice);

      Container got = download(kU2, store, alice, reg);
      if (got.uuid() != kU4 || got.get("sim/dice.json").as_json() != Json{8}) {
        std::cerr << "redirect chain not followed: " << got.uuid() << "\n"; return 1;
      }
      auto fetched = store.get(kU2, alice);
      if (!fetched.moved_to || *fetched.moved_to != kU3 || fetched.archive) { std::cerr << "get redirect\n"; return 1; }

      Container fork(payload("55555555-5555-4555-8555-555555555555", "2024-03-03T00:00:00Z", true, 9, kU2), reg);
      if (!throws<StaleWrite>([&] { (void)upload(fork, store, alice); })) { std::cerr << "second supersede accepted\n"; return 1; }
    }

    // Static dedup
    {
      const auto before = record_count(root);
      Container a(static_payload(), reg);
      a.freeze();
      auto ra = upload(a, store, alice);
      if (ra.outcome != UploadOutcome::kCreated) { std::cerr << "static create\n"; return 1; }

      Container b(static_payload(), reg);
      b.freeze();
      if (b.uuid() == a.uuid() || *b.content().hash != *a.content().hash) { std::cerr << "static twins\n"; return 1; }
      auto rb = upload(b, store, bob);
      if (rb.outcome != UploadOutcome::kDeduplicated || b.uuid() != a.uuid() || rb.uuid != a.uuid()) {
        std::cerr << "dedup did not adopt the stored twin\n"; return 1;
      }
      if (!(b.content() == a.content()) || b.is_mutable()) { std::cerr << "adopted state\n"; return 1; }
      if (record_count(root) != before + 1) { std::cerr << "dedup created a record\n"; return 1; }

      // A different container type is a different dataset
      Payload p = static_payload();
      p["content.json"] = Json{{"containerType", {{"name", "calibration2"}}}};
      Container c(p, reg);
      c.freeze();
      if (upload(c, store, alice).outcome != UploadOutcome::kCreated) { std::cerr << "type name ignored in dedup\n"; return 1; }

      // Recorded hash must match the content
      Payload tampered = static_payload();
      tampered["content.json"] = Json{{"containerType", {{"name", "calibration"}}},
                                      {"static", true},
                                      {"hash", std::string(64, '0')}};
      Container t(tampered, reg);
      if (!throws<SchemaViolation>([&] { (void)upload(t, store, alice); })) { std::cerr << "bad static hash uploaded\n"; return 1; }
    }

    // Lookup failures and endpoint defaults
    {
      if (!throws<NotFound>([&] { (void)download("66666666-6666-4666-8666-666666666666", store, alice, reg); })) {
        std::cerr << "download unknown\n"; return 1;
      }
      Defaults d;
      d.server = root.string();
      d.key = "carol-token";
      Container c(payload("77777777-7777-4777-8777-777777777777", "2024-04-01T00:00:00Z", true, 3), reg);
      if (upload(c, "", Credential{}, d).outcome != UploadOutcome::kCreated) { std::cerr << "defaults endpoint\n"; return 1; }
      Container back = download(c.uuid(), root.string(), Credential{}, reg, d);
      if (back.uuid() != c.uuid()) { std::cerr << "defaults download\n"; return 1; }

      Container n(payload("88888888-8888-4888-8888-888888888888", "2024-04-01T00:00:00Z", true, 3), reg);
      if (!throws<NotFound>([&] { (void)upload(n, "", Credential{}, Defaults{}); })) { std::cerr << "no endpoint\n"; return 1; }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec;
    stdfs::remove_all(root, ec);
    return 1;
  }
  std::error_code ec;
  stdfs::remove_all(root, ec);
  std::cout << "sync_fs OK\n";
  return 0;
}
