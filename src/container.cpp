#include "scidata/container.hpp"

#include "scidata/archive.hpp"
#include "scidata/consts.hpp"
#include "scidata/errors.hpp"
#include "scidata/fs.hpp"
#include "scidata/hashing.hpp"
#include "scidata/logging.hpp"
#include "scidata/time.hpp"
#include "scidata/util.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace scidata {

namespace {

const Json &reserved_json(const Payload &items, std::string_view name) {
  auto it = items.find(std::string(name));
  if (it == items.end()) {
    throw SchemaViolation("missing required item '" + std::string(name) + "'");
  }
  if (!it->second.is_json()) {
    throw SchemaViolation("'" + std::string(name) + "' must hold a JSON object");
  }
  return it->second.as_json();
}

Json parse_reserved(const std::map<std::string, const archive::Entry *> &entries,
                    std::string_view name) {
  auto it = entries.find(std::string(name));
  if (it == entries.end()) {
    throw CorruptArchive("archive has no '" + std::string(name) + "'");
  }
  const auto &data = it->second->data;
  try {
    return Json::parse(data.begin(), data.end());
  } catch (const Json::parse_error &e) {
    throw CorruptArchive("'" + std::string(name) + "' is not valid JSON: " + e.what());
  }
}

} // namespace

// ——— Construction ———

Container::Container(const Payload &items, const CodecRegistry &registry, const Defaults &defaults)
    : registry_(&registry) {
  auto attrs = validate_and_default(reserved_json(items, consts::kContentItem),
                                    reserved_json(items, consts::kMetaItem), defaults);
  content_ = std::move(attrs.content);
  meta_ = std::move(attrs.meta);

  for (const auto &[name, value] : items) {
    if (is_reserved_name(name)) {
      continue;
    }
    items_.set(name, value);
  }
  // A static payload is sealed from the start.
  state_ = content_.is_static ? State::kImmutable : State::kMutable;
}

Container Container::from_archive(std::span<const std::uint8_t> bytes,
                                  const CodecRegistry &registry) {
  const auto entries = archive::read_zip(bytes);

  std::map<std::string, const archive::Entry *> by_name;
  for (const auto &e : entries) {
    by_name.emplace(e.name, &e);
  }

  Container c(registry);
  auto attrs = validate_and_default(parse_reserved(by_name, consts::kContentItem),
                                    parse_reserved(by_name, consts::kMetaItem));
  c.content_ = std::move(attrs.content);
  c.meta_ = std::move(attrs.meta);

  for (const auto &e : entries) {
    if (is_reserved_name(e.name)) {
      continue;
    }
    try {
      validate_item_name(e.name);
    } catch (const InvalidName &ex) {
      throw CorruptArchive(std::string("bad entry name in archive: ") + ex.what());
    }
    const auto ext = extension_of(e.name);
    CodecPtr codec = registry.find(ext);
    if (codec) {
      c.items_.set(e.name, codec->decode(e.data));
    } else {
      // Unknown format: keep the raw bytes so nothing is lost on rewrite.
      c.items_.set(e.name, Bytes(e.data));
    }
  }

  c.state_ = State::kImmutable;
  return c;
}

Container Container::load(const std::filesystem::path &path, const CodecRegistry &registry) {
  if (!fs::exists(path)) {
    throw NotFound("no archive at " + path.string());
  }
  const auto bytes = fs::read_file(path);
  Container c = from_archive(bytes, registry);
  SCIDATA_LOG_INFO("container loaded", {logging::StringField("path", path.string()),
                                        logging::StringField("uuid", c.uuid()),
                                        logging::IntField("items", static_cast<std::int64_t>(
                                                                       c.items_.size()))});
  return c;
}

// ——— Lifecycle helpers ———

void Container::require_mutable(std::string_view op) const {
  if (!CanMutate(state_)) {
    throw ImmutableContainer("cannot " + std::string(op) + ": container " + content_.uuid +
                             " is immutable");
  }
}

void Container::touch() { content_.modified = std::max(timeutil::now_utc(), content_.modified); }

void Container::seal(Trigger trigger) { state_ = NextState(state_, trigger); }

void Container::accept_remote(const ContentDescriptor &accepted) {
  content_.created = accepted.created;
  content_.modified = accepted.modified;
}

// ——— Attributes ———

void Container::set_content(ContentDescriptor content) {
  require_mutable("set content");
  if (content.is_static != content_.is_static) {
    throw SchemaViolation("static can only be set by freeze()");
  }
  content.uuid = content_.uuid;
  content.created = content_.created;
  content.hash = content_.hash;
  content.model_version = content_.model_version;
  content.modified = std::max(content.modified, content_.modified);
  validate(content);

  content_ = std::move(content);
  touch();
}

void Container::set_meta(Metadata meta) {
  require_mutable("set meta");
  validate(meta);
  meta_ = std::move(meta);
  touch();
}

// ——— Items ———

Value Container::get(std::string_view name) const {
  if (name == consts::kContentItem) {
    return Value(Json(content_));
  }
  if (name == consts::kMetaItem) {
    return Value(Json(meta_));
  }
  return items_.get(name);
}

bool Container::contains(std::string_view name) const {
  return is_reserved_name(name) || items_.contains(name);
}

void Container::set(std::string_view name, Value value) {
  require_mutable("set '" + std::string(name) + "'");
  items_.set(name, std::move(value));
  touch();
}

void Container::remove(std::string_view name) {
  require_mutable("remove '" + std::string(name) + "'");
  if (is_reserved_name(name)) {
    throw InvalidName("'" + std::string(name) + "' is required and cannot be removed");
  }
  items_.remove(name);
  touch();
}

std::vector<std::string> Container::list_names() const {
  std::vector<std::string> names = items_.names();
  names.emplace_back(consts::kContentItem);
  names.emplace_back(consts::kMetaItem);
  std::ranges::sort(names, ItemNameLess{});
  return names;
}

// ——— Hash / freeze / release ———

std::string Container::hash() {
  auto digest = content_digest(*this);
  if (content_.is_static && content_.hash && *content_.hash != digest) {
    throw SchemaViolation("static container " + content_.uuid +
                          " does not match its recorded hash");
  }
  content_.hash = digest;
  seal(Trigger::kHash);
  return digest;
}

void Container::freeze() {
  if (content_.is_static) {
    throw AlreadyStatic("container " + content_.uuid + " is already static");
  }
  content_.hash = content_digest(*this);
  content_.is_static = true;
  seal(Trigger::kFreeze);
  SCIDATA_LOG_DEBUG("container frozen", {logging::StringField("uuid", content_.uuid),
                                         logging::StringField("hash", *content_.hash)});
}

void Container::release() {
  const auto previous = content_.uuid;
  const auto now = timeutil::now_utc();

  content_.uuid = generate_uuid();
  content_.replaces.reset();
  content_.hash.reset();
  content_.is_static = false;
  content_.created = now;
  content_.modified = now;
  content_.model_version = std::string(consts::kModelVersion);
  state_ = NextState(state_, Trigger::kRelease);

  SCIDATA_LOG_DEBUG("container released", {logging::StringField("from", previous),
                                           logging::StringField("uuid", content_.uuid)});
}

// ——— Serialization ———

std::vector<std::uint8_t> Container::to_archive() {
  hash();
  seal(Trigger::kSerialize);

  std::vector<archive::Entry> entries;
  entries.reserve(items_.size() + 2);
  for (const auto &name : list_names()) {
    Bytes data;
    if (name == consts::kContentItem) {
      data = registry_->encode("json", Value(Json(content_)));
    } else if (name == consts::kMetaItem) {
      data = registry_->encode("json", Value(Json(meta_)));
    } else {
      data = registry_->encode_with(extension_of(name), items_.get(name)).bytes;
    }
    entries.push_back(archive::Entry{.name = name, .data = std::move(data)});
  }
  return archive::write_zip(entries, content_.modified);
}

void Container::write(const std::filesystem::path &path) {
  const auto bytes = to_archive();
  fs::write_file_atomic(path, bytes);
  SCIDATA_LOG_INFO("container written", {logging::StringField("path", path.string()),
                                         logging::StringField("uuid", content_.uuid),
                                         logging::IntField("bytes", static_cast<std::int64_t>(
                                                                        bytes.size()))});
}

std::string Container::summary() const {
  std::ostringstream out;
  out << "uuid:     " << content_.uuid << '\n';
  if (content_.replaces) {
    out << "replaces: " << *content_.replaces << '\n';
  }
  out << "type:     " << content_.container_type.name;
  if (content_.container_type.version) {
    out << ' ' << *content_.container_type.version;
  }
  out << '\n';
  out << "title:    " << meta_.title << '\n';
  out << "author:   " << meta_.author << " <" << meta_.email << ">\n";
  out << "created:  " << timeutil::format_timestamp(content_.created) << '\n';
  out << "modified: " << timeutil::format_timestamp(content_.modified) << '\n';
  out << "state:    " << StateName(state_) << (content_.is_static ? ", static" : "")
      << (content_.complete ? ", complete" : ", multi-step") << '\n';
  if (content_.hash) {
    out << "hash:     " << *content_.hash << '\n';
  }
  out << "items:\n";
  for (const auto &[name, value] : items_.entries()) {
    out << "  " << name << " (" << kind_name(value.kind()) << ")\n";
  }
  return out.str();
}

} // namespace scidata
