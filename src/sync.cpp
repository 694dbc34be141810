#include "scidata/sync.hpp"

#include "scidata/consts.hpp"
#include "scidata/errors.hpp"
#include "scidata/hashing.hpp"
#include "scidata/logging.hpp"

#include <set>

namespace scidata {

std::string_view outcome_name(UploadOutcome outcome) {
  switch (outcome) {
  case UploadOutcome::kCreated:
    return "created";
  case UploadOutcome::kReplaced:
    return "replaced";
  case UploadOutcome::kDeduplicated:
    return "deduplicated";
  }
  return "unknown";
}

UploadResult SyncEngine::upload(Container &container) {
  container.seal(Trigger::kUpload);

  if (container.content().is_static) {
    // hash() also verifies the recorded hash against the content
    const auto digest = container.hash();
    const auto &type_name = container.content().container_type.name;
    if (auto twin = store_.find_static(type_name, digest, cred_)) {
      const auto local_uuid = container.uuid();
      container = Container::from_archive(*twin, container.registry());
      SCIDATA_LOG_INFO("upload: deduplicated static container",
                       {logging::StringField("local", local_uuid),
                        logging::StringField("uuid", container.uuid()),
                        logging::StringField("hash", digest)});
      return UploadResult{.outcome = UploadOutcome::kDeduplicated,
                          .uuid = container.uuid(),
                          .accepted = container.content()};
    }
  }

  const auto bytes = container.to_archive();
  const auto &uuid = container.uuid();

  UploadOutcome outcome = UploadOutcome::kCreated;
  ContentDescriptor accepted;
  if (store_.contains(uuid, cred_)) {
    accepted = store_.replace(uuid, bytes, cred_);
    outcome = UploadOutcome::kReplaced;
  } else {
    accepted = store_.create(bytes, cred_);
  }
  container.accept_remote(accepted);

  SCIDATA_LOG_INFO("upload: accepted", {logging::StringField("uuid", uuid),
                                        logging::StringField("outcome", outcome_name(outcome)),
                                        logging::BoolField("complete", accepted.complete),
                                        logging::IntField("bytes", static_cast<std::int64_t>(
                                                                       bytes.size()))});
  return UploadResult{.outcome = outcome, .uuid = uuid, .accepted = accepted};
}

Container SyncEngine::download(const std::string &uuid, const CodecRegistry &registry) {
  std::set<std::string> seen;
  std::string cur = uuid;
  for (int hops = 0; hops <= consts::kMaxRedirects; ++hops) {
    if (!seen.insert(cur).second) {
      throw NotFound("replaces-chain from " + uuid + " loops at " + cur);
    }
    auto r = store_.get(cur, cred_);
    if (r.moved_to) {
      SCIDATA_LOG_DEBUG("download: redirected", {logging::StringField("from", cur),
                                                 logging::StringField("to", *r.moved_to)});
      cur = *r.moved_to;
      continue;
    }
    Container c = Container::from_archive(*r.archive, registry);
    SCIDATA_LOG_INFO("download: fetched", {logging::StringField("requested", uuid),
                                           logging::StringField("uuid", c.uuid())});
    return c;
  }
  throw NotFound("replaces-chain from " + uuid + " is longer than " +
                 std::to_string(consts::kMaxRedirects));
}

UploadResult upload(Container &container, RemoteStore &store, const Credential &cred) {
  return SyncEngine(store, cred).upload(container);
}

Container download(const std::string &uuid, RemoteStore &store, const Credential &cred,
                   const CodecRegistry &registry) {
  return SyncEngine(store, cred).download(uuid, registry);
}

namespace {

std::unique_ptr<RemoteStore> store_for(const std::string &endpoint, const Defaults &defaults) {
  const std::string &ep = endpoint.empty() ? defaults.server : endpoint;
  if (ep.empty()) {
    throw NotFound("no store endpoint given and none configured");
  }
  return open_store(ep);
}

Credential credential_for(const Credential &cred, const Defaults &defaults) {
  return cred.token.empty() ? Credential{.token = defaults.key} : cred;
}

} // namespace

UploadResult upload(Container &container, const std::string &endpoint, const Credential &cred,
                    const Defaults &defaults) {
  auto store = store_for(endpoint, defaults);
  return upload(container, *store, credential_for(cred, defaults));
}

Container download(const std::string &uuid, const std::string &endpoint, const Credential &cred,
                   const CodecRegistry &registry, const Defaults &defaults) {
  auto store = store_for(endpoint, defaults);
  return download(uuid, *store, credential_for(cred, defaults), registry);
}

} // namespace scidata
