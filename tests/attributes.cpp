#include "scidata/attributes.hpp"
#include "scidata/errors.hpp"
#include "scidata/time.hpp"
#include "scidata/util.hpp"

#include <iostream>

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

static Json base_content() { return {{"containerType", {{"name", "demo"}}}}; }
static Json base_meta() { return {{"author", "A"}, {"email", "a@x"}, {"title", "T"}}; }

int main() {
  try {
    // Defaults
    const auto before = timeutil::now_utc();
    Defaults d;
    d.identity = {"Default Author", "default@example.org"};
    auto a = validate_and_default(base_content(), Json{{"title", "T"}}, d);
    if (!looks_uuid(a.content.uuid)) { std::cerr << "uuid not generated\n"; return 1; }
    if (a.content.model_version != "1.0") { std::cerr << "modelVersion\n"; return 1; }
    if (a.content.created < before || a.content.modified != a.content.created) { std::cerr << "timestamps\n"; return 1; }
    if (a.content.is_static || !a.content.complete || a.content.hash) { std::cerr << "flag defaults\n"; return 1; }
    if (a.meta.author != "Default Author" || a.meta.email != "default@example.org") { std::cerr << "identity defaults\n"; return 1; }

    // Explicit values win over defaults
    auto b = validate_and_default(base_content(), base_meta(), d);
    if (b.meta.author != "A" || b.meta.email != "a@x") { std::cerr << "explicit author overridden\n"; return 1; }

    // Idempotent on already valid records
    {
      Json content = base_content();
      content["usedSoftware"] = Json::array({{{"name", "sim"}, {"version", "2.1"}, {"id", "10.1/x"}, {"idType", "doi"}}});
      content["containerType"]["id"] = "10.5281/zenodo.1";
      content["containerType"]["version"] = "3";
      content["modified"] = "2024-03-01T10:00:00+02:00";
      Json meta = base_meta();
      meta["keywords"] = {"dice", "sim"};
      meta["license"] = "CC-BY-4.0";
      auto first = validate_and_default(content, meta);
      auto second = validate_and_default(Json(first.content), Json(first.meta));
      if (!(first.content == second.content) || !(first.meta == second.meta)) {
        std::cerr << "validate_and_default not idempotent\n"; return 1;
      }
      std::time_t expect = 0;
      (void)timeutil::parse_timestamp("2024-03-01T08:00:00Z", expect);
      if (first.content.modified != expect || first.content.created != expect) {
        std::cerr << "offset not normalized / created not derived from modified\n"; return 1;
      }
      if (Json(first.content)["modified"] != "2024-03-01T08:00:00+00:00") { std::cerr << "timestamp format\n"; return 1; }
    }

    // Violations
    auto bad_content = [&](Json c) {
      return throws<SchemaViolation>([&] { (void)validate_and_default(c, base_meta()); });
    };
    Json c;
    if (!throws<SchemaViolation>([&] { (void)validate_and_default(base_content(), Json{{"title", "T"}}); })) {
      std::cerr << "missing author accepted\n"; return 1;
    }
    if (!throws<SchemaViolation>([&] { (void)validate_and_default(base_content(), Json{{"author", "A"}, {"email", "e"}}); })) {
      std::cerr << "missing title accepted\n"; return 1;
    }
    if (!bad_content(Json::object())) { std::cerr << "missing containerType accepted\n"; return 1; }
    c = base_content(); c["containerType"]["name"] = "two words";
    if (!bad_content(c)) { std::cerr << "whitespace name accepted\n"; return 1; }
    c = base_content(); c["containerType"]["id"] = "x";
    if (!bad_content(c)) { std::cerr << "id without version accepted\n"; return 1; }
    c = base_content(); c["usedSoftware"] = Json::array({{{"name", "s"}, {"version", "1"}, {"id", "x"}}});
    if (!bad_content(c)) { std::cerr << "software id without idType accepted\n"; return 1; }
    c = base_content(); c["static"] = true;
    if (!bad_content(c)) { std::cerr << "static without hash accepted\n"; return 1; }
    c = base_content(); c["created"] = "2024-01-02T00:00:00Z"; c["modified"] = "2024-01-01T00:00:00Z";
    if (!bad_content(c)) { std::cerr << "modified before created accepted\n"; return 1; }
    c = base_content(); c["created"] = "yesterday";
    if (!bad_content(c)) { std::cerr << "bad timestamp accepted\n"; return 1; }
    c = base_content(); c["uuid"] = "not-a-uuid";
    if (!bad_content(c)) { std::cerr << "bad uuid accepted\n"; return 1; }
    c = base_content(); c["hash"] = "abc";
    if (!bad_content(c)) { std::cerr << "bad hash accepted\n"; return 1; }
    c = base_content(); c["complete"] = "yes";
    if (!bad_content(c)) { std::cerr << "non-bool complete accepted\n"; return 1; }

    // Typed validate() applies the same rules
    ContentDescriptor cd = b.content;
    cd.replaces = cd.uuid;
    if (!throws<SchemaViolation>([&] { validate(cd); })) { std::cerr << "self replace accepted\n"; return 1; }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "attributes OK\n";
  return 0;
}
