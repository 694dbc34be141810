#pragma once

#include "scidata/attributes.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace scidata {

// Opaque token identifying the calling principal.
struct Credential {
  std::string token;
};

// Result of RemoteStore::get: either the archive or the identifier that
// superseded the requested one.
struct FetchResult {
  std::optional<std::vector<std::uint8_t>> archive;
  std::optional<std::string> moved_to;
};

/**
 * Remote container store.
 *
 * The store is the authority for the remote rules: it rejects replacing a
 * complete or static entry (ImmutableRemote), a non-increasing modified
 * timestamp (StaleWrite) and supersession or replacement by anyone but the
 * creating principal (NotOwner). Archives travel as .zdc bytes; the returned
 * descriptor is the state the store accepted.
 */
class RemoteStore {
public:
  virtual ~RemoteStore() = default;

  virtual ContentDescriptor create(std::span<const std::uint8_t> archive,
                                   const Credential &cred) = 0;
  virtual ContentDescriptor replace(const std::string &uuid, std::span<const std::uint8_t> archive,
                                    const Credential &cred) = 0;
  virtual FetchResult get(const std::string &uuid, const Credential &cred) = 0;
  virtual std::optional<std::vector<std::uint8_t>>
  find_static(const std::string &type_name, const std::string &hash, const Credential &cred) = 0;
  virtual bool contains(const std::string &uuid, const Credential &cred) = 0;
};

/**
 * Directory-backed store:
 *   records/<uuid>.json            owner, flags, timestamps, replaced_by
 *   archives/<ab>/<uuid>.zdc       archive bytes (fan-out by uuid prefix)
 *   static/<sha256(name)>/<hash>   uuid of the first static upload
 *
 * Every file is written atomically. Calls are serialized by one mutex, so a
 * single instance may be shared between server threads.
 */
class FsRemoteStore final : public RemoteStore {
public:
  explicit FsRemoteStore(std::filesystem::path root);

  ContentDescriptor create(std::span<const std::uint8_t> archive, const Credential &cred) override;
  ContentDescriptor replace(const std::string &uuid, std::span<const std::uint8_t> archive,
                            const Credential &cred) override;
  FetchResult get(const std::string &uuid, const Credential &cred) override;
  std::optional<std::vector<std::uint8_t>> find_static(const std::string &type_name,
                                                       const std::string &hash,
                                                       const Credential &cred) override;
  bool contains(const std::string &uuid, const Credential &cred) override;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  [[nodiscard]] std::filesystem::path record_path(const std::string &uuid) const;
  [[nodiscard]] std::filesystem::path archive_path(const std::string &uuid) const;
  [[nodiscard]] std::filesystem::path static_path(const std::string &type_name,
                                                  const std::string &hash) const;

  std::filesystem::path root_;
  std::mutex mu_;
};

// Read content.json out of archive bytes. CorruptArchive / SchemaViolation.
ContentDescriptor read_descriptor(std::span<const std::uint8_t> archive);

// Principal id recorded as owner: SHA-256 hex of the token.
std::string owner_of(const Credential &cred);

// "tcp://host[:port]" -> TcpRemoteStore, anything else -> FsRemoteStore.
std::unique_ptr<RemoteStore> open_store(const std::string &endpoint);

} // namespace scidata
