#pragma once

#include "scidata/config.hpp"
#include "scidata/container.hpp"
#include "scidata/remote.hpp"

#include <string>

namespace scidata {

enum class UploadOutcome {
  kCreated,
  kReplaced,
  kDeduplicated, // a static twin already existed; the local container adopted it
};

std::string_view outcome_name(UploadOutcome outcome);

struct UploadResult {
  UploadOutcome outcome;
  std::string uuid;
  ContentDescriptor accepted;
};

/**
 * Reconciles local containers with one remote store under one credential.
 *
 * upload() seals the container. Static containers are first looked up by
 * (containerType.name, hash); a hit replaces the local state with the
 * stored twin. Otherwise an unknown uuid is created and a known one is
 * replaced, subject to the store's rules.
 *
 * download() follows replaces-chains to the newest entry.
 */
class SyncEngine {
public:
  SyncEngine(RemoteStore &store, Credential cred) : store_(store), cred_(std::move(cred)) {}

  UploadResult upload(Container &container);
  Container download(const std::string &uuid, const CodecRegistry &registry);

private:
  RemoteStore &store_;
  Credential cred_;
};

UploadResult upload(Container &container, RemoteStore &store, const Credential &cred);
Container download(const std::string &uuid, RemoteStore &store, const Credential &cred,
                   const CodecRegistry &registry);

// Endpoint and credential variants; empty arguments fall back to
// defaults.server / defaults.key.
UploadResult upload(Container &container, const std::string &endpoint, const Credential &cred,
                    const Defaults &defaults = {});
Container download(const std::string &uuid, const std::string &endpoint, const Credential &cred,
                   const CodecRegistry &registry, const Defaults &defaults = {});

} // namespace scidata
