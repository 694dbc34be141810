#pragma once

#include "scidata/consts.hpp"
#include "scidata/remote.hpp"

#include <atomic>
#include <string>

namespace scidata {

/**
 * RemoteStore client speaking the line protocol served by StoreServer.
 *
 * One connection per call:
 *   -> HELLO 1
 *   -> AUTH <token>
 *   -> OP CREATE | OP REPLACE <uuid> | OP GET <uuid> | OP FIND <hash> | OP HAS <uuid>
 *   -> [DATA <n>\n<n bytes>]      archive for CREATE/REPLACE, type name for FIND
 *   <- OK [DATA <n>\n<n bytes>] | REDIRECT <uuid> | NONE | ERR <Kind> <message>
 *
 * Send and receive (and connect) are bounded by the timeout. Calls are never
 * retried; transport failures surface as std::system_error.
 */
class TcpRemoteStore final : public RemoteStore {
public:
  TcpRemoteStore(std::string host, int port, int timeout_ms = consts::kDefaultTimeoutMs);

  ContentDescriptor create(std::span<const std::uint8_t> archive, const Credential &cred) override;
  ContentDescriptor replace(const std::string &uuid, std::span<const std::uint8_t> archive,
                            const Credential &cred) override;
  FetchResult get(const std::string &uuid, const Credential &cred) override;
  std::optional<std::vector<std::uint8_t>> find_static(const std::string &type_name,
                                                       const std::string &hash,
                                                       const Credential &cred) override;
  bool contains(const std::string &uuid, const Credential &cred) override;

private:
  std::string host_;
  int port_;
  int timeout_ms_;
};

/**
 * Serves a RemoteStore over TCP, one client at a time.
 *
 * bind() then run() on a dedicated thread; stop() from another thread makes
 * run() return.
 */
class StoreServer {
public:
  explicit StoreServer(RemoteStore &store, int timeout_ms = consts::kDefaultTimeoutMs);
  ~StoreServer();

  StoreServer(const StoreServer &) = delete;
  StoreServer &operator=(const StoreServer &) = delete;

  // Port 0 picks a free port; see port().
  void bind(const std::string &host = "0.0.0.0", int port = consts::portNumber);
  [[nodiscard]] int port() const { return port_; }

  void run();
  void stop();

private:
  void handle_client(int fd);

  RemoteStore &store_;
  int timeout_ms_;
  int listen_fd_{-1};
  int port_{0};
  std::atomic<bool> stopping_{false};
};

} // namespace scidata
