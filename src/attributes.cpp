#include "scidata/attributes.hpp"

#include "scidata/consts.hpp"
#include "scidata/errors.hpp"
#include "scidata/time.hpp"
#include "scidata/util.hpp"

#include <algorithm>
#include <string_view>

namespace scidata {

namespace {

// ——— JSON field readers (record name is used in error messages) ———

const Json *field(const Json &obj, std::string_view key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::optional<std::string> opt_string(const Json &obj, std::string_view key,
                                      std::string_view where) {
  const Json *v = field(obj, key);
  if (!v) {
    return std::nullopt;
  }
  if (!v->is_string()) {
    throw SchemaViolation(std::string(where) + ": '" + std::string(key) + "' must be a string");
  }
  return v->get<std::string>();
}

std::string req_string(const Json &obj, std::string_view key, std::string_view where) {
  auto v = opt_string(obj, key, where);
  if (!v || v->empty()) {
    throw SchemaViolation(std::string(where) + ": '" + std::string(key) + "' is required");
  }
  return *v;
}

std::optional<bool> opt_bool(const Json &obj, std::string_view key, std::string_view where) {
  const Json *v = field(obj, key);
  if (!v) {
    return std::nullopt;
  }
  if (!v->is_boolean()) {
    throw SchemaViolation(std::string(where) + ": '" + std::string(key) + "' must be a boolean");
  }
  return v->get<bool>();
}

std::optional<std::time_t> opt_time(const Json &obj, std::string_view key, std::string_view where) {
  auto text = opt_string(obj, key, where);
  if (!text) {
    return std::nullopt;
  }
  std::time_t t = 0;
  if (!timeutil::parse_timestamp(*text, t)) {
    throw SchemaViolation(std::string(where) + ": '" + std::string(key) +
                          "' is not an ISO-8601 timestamp: " + *text);
  }
  return t;
}

const Json &require_object(const Json &j, std::string_view where) {
  if (!j.is_object()) {
    throw SchemaViolation(std::string(where) + " must be a JSON object");
  }
  return j;
}

ContainerType parse_container_type(const Json &obj) {
  constexpr std::string_view where = "content.json containerType";
  require_object(obj, where);
  ContainerType t;
  t.name = req_string(obj, "name", where);
  t.id = opt_string(obj, "id", where);
  t.version = opt_string(obj, "version", where);
  return t;
}

Software parse_software(const Json &obj) {
  constexpr std::string_view where = "content.json usedSoftware";
  require_object(obj, where);
  Software s;
  s.name = req_string(obj, "name", where);
  s.version = req_string(obj, "version", where);
  s.id = opt_string(obj, "id", where);
  s.id_type = opt_string(obj, "idType", where);
  return s;
}

void put_opt(Json &j, const char *key, const std::optional<std::string> &v) {
  if (v) {
    j[key] = *v;
  }
}

} // namespace

// ——— Serialization ———

void to_json(Json &j, const ContainerType &t) {
  j = Json{{"name", t.name}};
  put_opt(j, "id", t.id);
  put_opt(j, "version", t.version);
}

void to_json(Json &j, const Software &s) {
  j = Json{{"name", s.name}, {"version", s.version}};
  put_opt(j, "id", s.id);
  put_opt(j, "idType", s.id_type);
}

void to_json(Json &j, const ContentDescriptor &c) {
  j = Json::object();
  j["uuid"] = c.uuid;
  put_opt(j, "replaces", c.replaces);
  j["containerType"] = c.container_type;
  j["created"] = timeutil::format_timestamp(c.created);
  j["modified"] = timeutil::format_timestamp(c.modified);
  j["static"] = c.is_static;
  j["complete"] = c.complete;
  put_opt(j, "hash", c.hash);
  j["usedSoftware"] = c.used_software;
  j["modelVersion"] = c.model_version;
}

void to_json(Json &j, const Metadata &m) {
  j = Json::object();
  j["author"] = m.author;
  j["email"] = m.email;
  put_opt(j, "organization", m.organization);
  put_opt(j, "comment", m.comment);
  j["title"] = m.title;
  j["keywords"] = m.keywords;
  put_opt(j, "description", m.description);
  put_opt(j, "created", m.created);
  put_opt(j, "doi", m.doi);
  put_opt(j, "license", m.license);
}

// ——— Validation ———

void validate(const ContentDescriptor &c) {
  if (!looks_uuid(c.uuid)) {
    throw SchemaViolation("content.json: malformed uuid '" + c.uuid + "'");
  }
  if (c.replaces && !looks_uuid(*c.replaces)) {
    throw SchemaViolation("content.json: malformed replaces '" + *c.replaces + "'");
  }
  if (c.replaces && *c.replaces == c.uuid) {
    throw SchemaViolation("content.json: a container cannot replace itself");
  }
  if (c.container_type.name.empty()) {
    throw SchemaViolation("content.json: containerType.name is required");
  }
  if (strutil::has_whitespace(c.container_type.name)) {
    throw SchemaViolation("content.json: containerType.name contains whitespace: '" +
                          c.container_type.name + "'");
  }
  if (c.container_type.id && !c.container_type.version) {
    throw SchemaViolation("content.json: containerType.id requires containerType.version");
  }
  for (const auto &s : c.used_software) {
    if (s.name.empty() || s.version.empty()) {
      throw SchemaViolation("content.json: usedSoftware entries need name and version");
    }
    if (s.id && !s.id_type) {
      throw SchemaViolation("content.json: usedSoftware '" + s.name + "' has id without idType");
    }
  }
  if (c.hash && !looks_hex64(*c.hash)) {
    throw SchemaViolation("content.json: malformed hash");
  }
  if (c.is_static && !c.hash) {
    throw SchemaViolation("content.json: static container without hash");
  }
  if (c.modified < c.created) {
    throw SchemaViolation("content.json: modified precedes created");
  }
}

void validate(const Metadata &m) {
  if (m.author.empty()) {
    throw SchemaViolation("meta.json: 'author' is required");
  }
  if (m.email.empty()) {
    throw SchemaViolation("meta.json: 'email' is required");
  }
  if (m.title.empty()) {
    throw SchemaViolation("meta.json: 'title' is required");
  }
}

ContentDescriptor parse_content(const Json &content) {
  require_object(content, "content.json");
  const auto now = timeutil::now_utc();

  constexpr std::string_view cw = "content.json";
  ContentDescriptor c;
  c.uuid = opt_string(content, "uuid", cw).value_or(generate_uuid());
  c.replaces = opt_string(content, "replaces", cw);
  const Json *type = field(content, "containerType");
  if (!type) {
    throw SchemaViolation("content.json: 'containerType' is required");
  }
  c.container_type = parse_container_type(*type);
  const auto created = opt_time(content, "created", cw);
  const auto modified = opt_time(content, "modified", cw);
  c.created = created.value_or(modified ? std::min(*modified, now) : now);
  c.modified = modified.value_or(std::max(now, c.created));
  c.is_static = opt_bool(content, "static", cw).value_or(false);
  c.complete = opt_bool(content, "complete", cw).value_or(true);
  c.hash = opt_string(content, "hash", cw);
  if (const Json *sw = field(content, "usedSoftware")) {
    if (!sw->is_array()) {
      throw SchemaViolation("content.json: 'usedSoftware' must be a list");
    }
    for (const auto &entry : *sw) {
      c.used_software.push_back(parse_software(entry));
    }
  }
  c.model_version = std::string(consts::kModelVersion);
  validate(c);
  return c;
}

Attributes validate_and_default(const Json &content, const Json &meta, const Defaults &defaults) {
  require_object(meta, "meta.json");

  Attributes out;
  out.content = parse_content(content);

  // meta.json
  constexpr std::string_view mw = "meta.json";
  Metadata &m = out.meta;
  m.author = opt_string(meta, "author", mw).value_or("");
  if (m.author.empty()) {
    m.author = defaults.identity.name;
  }
  m.email = opt_string(meta, "email", mw).value_or("");
  if (m.email.empty()) {
    m.email = defaults.identity.email;
  }
  m.organization = opt_string(meta, "organization", mw);
  m.comment = opt_string(meta, "comment", mw);
  m.title = opt_string(meta, "title", mw).value_or("");
  if (const Json *kw = field(meta, "keywords")) {
    if (!kw->is_array()) {
      throw SchemaViolation("meta.json: 'keywords' must be a list");
    }
    for (const auto &k : *kw) {
      if (!k.is_string()) {
        throw SchemaViolation("meta.json: keywords must be strings");
      }
      m.keywords.push_back(k.get<std::string>());
    }
  }
  m.description = opt_string(meta, "description", mw);
  m.created = opt_string(meta, "created", mw);
  m.doi = opt_string(meta, "doi", mw);
  m.license = opt_string(meta, "license", mw);
  validate(m);

  return out;
}

} // namespace scidata
