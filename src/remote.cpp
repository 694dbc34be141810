#include "scidata/remote.hpp"

#include "scidata/archive.hpp"
#include "scidata/consts.hpp"
#include "scidata/errors.hpp"
#include "scidata/fs.hpp"
#include "scidata/hash.hpp"
#include "scidata/logging.hpp"
#include "scidata/tcp_remote.hpp"
#include "scidata/time.hpp"
#include "scidata/util.hpp"

#include <filesystem>
#include <string>

namespace stdfs = std::filesystem;

namespace scidata {

namespace {

// records/<uuid>.json
struct Record {
  std::string owner;
  std::string name;
  bool complete{true};
  bool is_static{false};
  std::optional<std::string> hash;
  std::optional<std::string> replaces;
  std::optional<std::string> replaced_by;
  std::time_t created{0};
  std::time_t modified{0};
};

Json record_to_json(const Record &r) {
  Json j = {{"owner", r.owner},
            {"name", r.name},
            {"complete", r.complete},
            {"static", r.is_static},
            {"created", timeutil::format_timestamp(r.created)},
            {"modified", timeutil::format_timestamp(r.modified)}};
  if (r.hash) {
    j["hash"] = *r.hash;
  }
  if (r.replaces) {
    j["replaces"] = *r.replaces;
  }
  if (r.replaced_by) {
    j["replaced_by"] = *r.replaced_by;
  }
  return j;
}

std::optional<std::string> opt_field(const Json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::time_t time_field(const Json &j, const char *key, const stdfs::path &where) {
  std::time_t t = 0;
  if (!timeutil::parse_timestamp(j.value(key, std::string{}), t)) {
    throw CorruptArchive("store record " + where.string() + " has a bad '" + key + "'");
  }
  return t;
}

Record read_record(const stdfs::path &p) {
  const auto bytes = fs::read_file(p);
  Json j;
  try {
    j = Json::parse(bytes.begin(), bytes.end());
  } catch (const Json::parse_error &e) {
    throw CorruptArchive("store record " + p.string() + " is not valid JSON: " + e.what());
  }
  Record r;
  r.owner = j.value("owner", std::string{});
  r.name = j.value("name", std::string{});
  r.complete = j.value("complete", true);
  r.is_static = j.value("static", false);
  r.hash = opt_field(j, "hash");
  r.replaces = opt_field(j, "replaces");
  r.replaced_by = opt_field(j, "replaced_by");
  r.created = time_field(j, "created", p);
  r.modified = time_field(j, "modified", p);
  return r;
}

void write_record(const stdfs::path &p, const Record &r) {
  fs::ensure_parent_dir(p);
  fs::write_file_atomic(p, record_to_json(r).dump(2) + "\n");
}

Record record_for(const ContentDescriptor &c, const Credential &cred) {
  Record r;
  r.owner = owner_of(cred);
  r.name = c.container_type.name;
  r.complete = c.complete;
  r.is_static = c.is_static;
  r.hash = c.hash;
  r.replaces = c.replaces;
  r.created = c.created;
  r.modified = c.modified;
  return r;
}

void require_uuid(const std::string &uuid) {
  if (!looks_uuid(uuid)) {
    throw NotFound("malformed container id '" + uuid + "'");
  }
}

} // namespace

std::string owner_of(const Credential &cred) { return to_hex(sha256(cred.token)); }

ContentDescriptor read_descriptor(std::span<const std::uint8_t> archive) {
  for (const auto &e : archive::read_zip(archive)) {
    if (e.name != consts::kContentItem) {
      continue;
    }
    try {
      return parse_content(Json::parse(e.data.begin(), e.data.end()));
    } catch (const Json::parse_error &ex) {
      throw CorruptArchive(std::string("content.json is not valid JSON: ") + ex.what());
    }
  }
  throw CorruptArchive("archive has no content.json");
}

// ——— FsRemoteStore ———

FsRemoteStore::FsRemoteStore(stdfs::path root) : root_(std::move(root)) {
  stdfs::create_directories(root_ / consts::kRecordsDir);
  stdfs::create_directories(root_ / consts::kArchivesDir);
  stdfs::create_directories(root_ / consts::kStaticDir);
}

stdfs::path FsRemoteStore::record_path(const std::string &uuid) const {
  return root_ / consts::kRecordsDir / (uuid + ".json");
}

stdfs::path FsRemoteStore::archive_path(const std::string &uuid) const {
  return root_ / consts::kArchivesDir / uuid.substr(0, consts::kFanoutDirLen) /
         (uuid + std::string(consts::kArchiveExt));
}

stdfs::path FsRemoteStore::static_path(const std::string &type_name,
                                       const std::string &hash) const {
  return root_ / consts::kStaticDir / to_hex(sha256(type_name)) / hash;
}

ContentDescriptor FsRemoteStore::create(std::span<const std::uint8_t> archive,
                                        const Credential &cred) {
  const ContentDescriptor c = read_descriptor(archive);
  std::lock_guard lock(mu_);

  if (fs::exists(record_path(c.uuid))) {
    throw StaleWrite("container " + c.uuid + " already exists in the store");
  }

  if (c.replaces) {
    const auto pred_path = record_path(*c.replaces);
    if (!fs::exists(pred_path)) {
      throw NotFound("superseded container " + *c.replaces + " is not in the store");
    }
    Record pred = read_record(pred_path);
    if (pred.owner != owner_of(cred)) {
      throw NotOwner("only the creator of " + *c.replaces + " may supersede it");
    }
    if (pred.replaced_by) {
      throw StaleWrite("container " + *c.replaces + " was already superseded by " +
                       *pred.replaced_by);
    }
    pred.replaced_by = c.uuid;
    // archive first, so a redirect never points at a missing entry
    fs::ensure_parent_dir(archive_path(c.uuid));
    fs::write_file_atomic(archive_path(c.uuid), archive);
    write_record(record_path(c.uuid), record_for(c, cred));
    write_record(pred_path, pred);
  } else {
    fs::ensure_parent_dir(archive_path(c.uuid));
    fs::write_file_atomic(archive_path(c.uuid), archive);
    write_record(record_path(c.uuid), record_for(c, cred));
  }

  if (c.is_static && c.hash) {
    const auto sp = static_path(c.container_type.name, *c.hash);
    if (!fs::exists(sp)) {
      fs::ensure_parent_dir(sp);
      fs::write_file_atomic(sp, c.uuid + "\n");
    }
  }

  SCIDATA_LOG_INFO("store: created", {logging::StringField("uuid", c.uuid),
                                      logging::StringField("type", c.container_type.name),
                                      logging::BoolField("complete", c.complete),
                                      logging::BoolField("static", c.is_static)});
  return c;
}

ContentDescriptor FsRemoteStore::replace(const std::string &uuid,
                                         std::span<const std::uint8_t> archive,
                                         const Credential &cred) {
  require_uuid(uuid);
  const ContentDescriptor c = read_descriptor(archive);
  if (c.uuid != uuid) {
    throw SchemaViolation("archive holds container " + c.uuid + ", not " + uuid);
  }

  std::lock_guard lock(mu_);
  const auto rp = record_path(uuid);
  if (!fs::exists(rp)) {
    throw NotFound("container " + uuid + " is not in the store");
  }
  Record cur = read_record(rp);

  if (cur.complete || cur.is_static) {
    throw ImmutableRemote("container " + uuid + " is complete in the store");
  }
  if (cur.owner != owner_of(cred)) {
    throw NotOwner("only the creator of " + uuid + " may replace it");
  }
  if (c.modified <= cur.modified) {
    throw StaleWrite("container " + uuid + ": modified " + timeutil::format_timestamp(c.modified) +
                     " is not after " + timeutil::format_timestamp(cur.modified));
  }
  if (c.replaces != cur.replaces) {
    throw SchemaViolation("container " + uuid + ": 'replaces' cannot change between uploads");
  }

  Record next = record_for(c, cred);
  next.created = cur.created;
  next.replaced_by = cur.replaced_by;
  fs::write_file_atomic(archive_path(uuid), archive);
  write_record(rp, next);

  if (c.is_static && c.hash) {
    const auto sp = static_path(c.container_type.name, *c.hash);
    if (!fs::exists(sp)) {
      fs::ensure_parent_dir(sp);
      fs::write_file_atomic(sp, c.uuid + "\n");
    }
  }

  SCIDATA_LOG_INFO("store: replaced", {logging::StringField("uuid", uuid),
                                       logging::StringField("modified",
                                                            timeutil::format_timestamp(c.modified)),
                                       logging::BoolField("complete", c.complete)});
  ContentDescriptor accepted = c;
  accepted.created = cur.created;
  return accepted;
}

FetchResult FsRemoteStore::get(const std::string &uuid, const Credential & /*cred*/) {
  require_uuid(uuid);
  std::lock_guard lock(mu_);
  const auto rp = record_path(uuid);
  if (!fs::exists(rp)) {
    throw NotFound("container " + uuid + " is not in the store");
  }
  const Record r = read_record(rp);
  if (r.replaced_by) {
    return FetchResult{.archive = std::nullopt, .moved_to = r.replaced_by};
  }
  return FetchResult{.archive = fs::read_file(archive_path(uuid)), .moved_to = std::nullopt};
}

std::optional<std::vector<std::uint8_t>> FsRemoteStore::find_static(const std::string &type_name,
                                                                    const std::string &hash,
                                                                    const Credential & /*cred*/) {
  if (!looks_hex64(hash)) {
    return std::nullopt;
  }
  std::lock_guard lock(mu_);
  const auto sp = static_path(type_name, hash);
  if (!fs::exists(sp)) {
    return std::nullopt;
  }
  const auto text = fs::read_file(sp);
  std::string uuid(text.begin(), text.end());
  strutil::rstrip_newlines(uuid);
  const auto ap = archive_path(uuid);
  if (!fs::exists(ap)) {
    throw CorruptArchive("static index points at missing container " + uuid);
  }
  return fs::read_file(ap);
}

bool FsRemoteStore::contains(const std::string &uuid, const Credential & /*cred*/) {
  if (!looks_uuid(uuid)) {
    return false;
  }
  std::lock_guard lock(mu_);
  return fs::exists(record_path(uuid));
}

// ——— Endpoint parsing ———

std::unique_ptr<RemoteStore> open_store(const std::string &endpoint) {
  constexpr std::string_view kTcp = "tcp://";
  if (std::string_view(endpoint).starts_with(kTcp)) {
    std::string rest = endpoint.substr(kTcp.size());
    int port = consts::portNumber;
    std::string host = rest;
    if (const auto colon = rest.rfind(':'); colon != std::string::npos) {
      host = rest.substr(0, colon);
      try {
        port = std::stoi(rest.substr(colon + 1));
      } catch (const std::exception &) {
        throw SchemaViolation("bad port in endpoint '" + endpoint + "'");
      }
    }
    if (host.empty()) {
      throw SchemaViolation("no host in endpoint '" + endpoint + "'");
    }
    return std::make_unique<TcpRemoteStore>(host, port);
  }
  if (endpoint.empty()) {
    throw SchemaViolation("empty store endpoint");
  }
  return std::make_unique<FsRemoteStore>(endpoint);
}

} // namespace scidata
