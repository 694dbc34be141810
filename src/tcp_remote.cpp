#include "scidata/tcp_remote.hpp"

#include "scidata/consts.hpp"
#include "scidata/errors.hpp"
#include "scidata/logging.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace scidata {

namespace {

constexpr std::size_t kMaxLine = 4096;
constexpr std::size_t kMaxPayload = std::size_t{1} << 28;
constexpr std::size_t kDataChunk = std::size_t{1} << 16;
constexpr std::string_view kOpHas = "OP HAS ";

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      close_if_open();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] explicit operator bool() const noexcept { return fd_ != -1; }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  [[nodiscard]] auto release() noexcept -> int {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd = -1) noexcept {
    if (fd_ != fd) {
      close_if_open();
      fd_ = fd;
    }
  }

private:
  int fd_{-1};

  void close_if_open() noexcept {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }
};

void set_timeouts(int fd, int timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
      ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
    throw std::system_error(errno, std::generic_category(), "setsockopt");
  }
}

[[nodiscard]] auto gai_error(int rc, std::string_view where, std::string_view host, int port)
    -> std::runtime_error {
  std::ostringstream os;
  os << where << " failed for " << host << ":" << port << ": " << gai_strerror(rc);
  return std::runtime_error(os.str());
}

// SO_SNDTIMEO also bounds connect() on Linux.
[[nodiscard]] auto connect_tcp(const std::string &host, int port, int timeout_ms) -> UniqueFd {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    throw gai_error(rc, "getaddrinfo", host, port);
  }

  UniqueFd sock;
  int last_errno = 0;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    UniqueFd fd(::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
    if (!fd) {
      last_errno = errno;
      continue;
    }
    set_timeouts(fd.get(), timeout_ms);
    if (::connect(fd.get(), rp->ai_addr, rp->ai_addrlen) == 0) {
      sock = std::move(fd);
      break;
    }
    last_errno = errno;
  }
  ::freeaddrinfo(res);

  if (!sock) {
    throw std::system_error(last_errno, std::generic_category(),
                            "connect " + host + ":" + port_s);
  }
  return sock;
}

void send_all(int fd, const void *buf, size_t n) {
  const auto *p = static_cast<const std::uint8_t *>(buf);
  while (n != 0U) {
    const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
    if (w <= 0) {
      throw std::system_error(errno, std::generic_category(), "send");
    }
    p += static_cast<size_t>(w);
    n -= static_cast<size_t>(w);
  }
}

void send_line(int fd, std::string_view s) {
  std::string t(s);
  t.push_back(consts::kLF);
  send_all(fd, t.data(), t.size());
}

void send_data(int fd, std::span<const std::uint8_t> data) {
  send_line(fd, std::string(consts::kTokData) + std::to_string(data.size()));
  if (!data.empty()) {
    send_all(fd, data.data(), data.size());
  }
}

void send_data(int fd, std::string_view text) {
  send_data(fd, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()),
                                              text.size()));
}

void recv_exact(int fd, std::uint8_t *dst, size_t n) {
  size_t got = 0;
  while (got < n) {
    const ssize_t r = ::recv(fd, dst + got, n - got, 0);
    if (r == 0) {
      throw std::runtime_error("connection closed by peer");
    }
    if (r < 0) {
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    got += static_cast<size_t>(r);
  }
}

[[nodiscard]] auto recv_line(int fd) -> std::string {
  std::string s;
  char c = '\0';
  for (;;) {
    const ssize_t r = ::recv(fd, &c, 1, 0);
    if (r == 0) {
      throw std::runtime_error("connection closed by peer");
    }
    if (r < 0) {
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    if (c == consts::kLF) {
      break;
    }
    if (s.size() >= kMaxLine) {
      throw std::runtime_error("protocol line too long");
    }
    s.push_back(c);
  }
  return s;
}

[[nodiscard]] auto recv_data(int fd) -> std::vector<std::uint8_t> {
  const std::string line = recv_line(fd);
  if (!std::string_view(line).starts_with(consts::kTokData)) {
    throw std::runtime_error("expected DATA <n>, got '" + line + "'");
  }
  size_t n = 0;
  try {
    n = std::stoull(line.substr(consts::kTokData.size()));
  } catch (const std::exception &) {
    throw std::runtime_error("malformed DATA header '" + line + "'");
  }
  if (n > kMaxPayload) {
    throw std::runtime_error("DATA payload too large");
  }
  // Grow with the bytes that actually arrive, not with the announced size.
  std::vector<std::uint8_t> buf;
  while (buf.size() < n) {
    const std::size_t at = buf.size();
    const std::size_t len = std::min(kDataChunk, n - at);
    buf.resize(at + len);
    recv_exact(fd, buf.data() + at, len);
  }
  return buf;
}

// Message text must stay on one line.
std::string one_line(std::string_view msg) {
  std::string out(msg);
  for (char &c : out) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return out;
}

// Response status line: "OK", "NONE", "REDIRECT <uuid>" pass through,
// "ERR <Kind> <message>" is rethrown as the matching typed error.
std::string expect_status(int fd) {
  std::string line = recv_line(fd);
  if (std::string_view(line).starts_with(consts::kTokErr)) {
    std::string_view rest = std::string_view(line).substr(consts::kTokErr.size());
    const auto sp = rest.find(consts::kSpace);
    const auto kind_text = rest.substr(0, sp);
    const std::string msg = sp == std::string_view::npos ? "" : std::string(rest.substr(sp + 1));
    ErrorKind kind{};
    if (!parse_kind(kind_text, kind)) {
      throw std::runtime_error("store error: " + std::string(rest));
    }
    raise(kind, msg);
  }
  return line;
}

ContentDescriptor descriptor_from(std::span<const std::uint8_t> bytes) {
  try {
    return parse_content(Json::parse(bytes.begin(), bytes.end()));
  } catch (const Json::parse_error &e) {
    throw std::runtime_error(std::string("malformed descriptor from store: ") + e.what());
  }
}

void check_token(const Credential &cred) {
  if (cred.token.find(consts::kLF) != std::string::npos ||
      cred.token.find('\r') != std::string::npos) {
    throw SchemaViolation("credential token contains a line break");
  }
}

// Opens the connection and sends the preamble shared by every request.
UniqueFd open_request(const std::string &host, int port, int timeout_ms, const Credential &cred,
                      std::string_view op) {
  check_token(cred);
  auto sock = connect_tcp(host, port, timeout_ms);
  send_line(sock.get(), consts::kHelloLine);
  send_line(sock.get(), std::string(consts::kTokAuth) + cred.token);
  send_line(sock.get(), op);
  return sock;
}

} // namespace

// ——— Client ———

TcpRemoteStore::TcpRemoteStore(std::string host, int port, int timeout_ms)
    : host_(std::move(host)), port_(port), timeout_ms_(timeout_ms) {}

ContentDescriptor TcpRemoteStore::create(std::span<const std::uint8_t> archive,
                                         const Credential &cred) {
  auto sock = open_request(host_, port_, timeout_ms_, cred, consts::kOpCreate);
  send_data(sock.get(), archive);
  const auto status = expect_status(sock.get());
  if (status != consts::kTokOk) {
    throw std::runtime_error("unexpected reply to CREATE: '" + status + "'");
  }
  return descriptor_from(recv_data(sock.get()));
}

ContentDescriptor TcpRemoteStore::replace(const std::string &uuid,
                                          std::span<const std::uint8_t> archive,
                                          const Credential &cred) {
  auto sock = open_request(host_, port_, timeout_ms_, cred, std::string(consts::kOpReplace) + uuid);
  send_data(sock.get(), archive);
  const auto status = expect_status(sock.get());
  if (status != consts::kTokOk) {
    throw std::runtime_error("unexpected reply to REPLACE: '" + status + "'");
  }
  return descriptor_from(recv_data(sock.get()));
}

FetchResult TcpRemoteStore::get(const std::string &uuid, const Credential &cred) {
  auto sock = open_request(host_, port_, timeout_ms_, cred, std::string(consts::kOpGet) + uuid);
  const auto status = expect_status(sock.get());
  if (std::string_view(status).starts_with(consts::kTokRedirect)) {
    return FetchResult{.archive = std::nullopt,
                       .moved_to = status.substr(consts::kTokRedirect.size())};
  }
  if (status != consts::kTokOk) {
    throw std::runtime_error("unexpected reply to GET: '" + status + "'");
  }
  return FetchResult{.archive = recv_data(sock.get()), .moved_to = std::nullopt};
}

std::optional<std::vector<std::uint8_t>>
TcpRemoteStore::find_static(const std::string &type_name, const std::string &hash,
                            const Credential &cred) {
  auto sock = open_request(host_, port_, timeout_ms_, cred, std::string(consts::kOpFind) + hash);
  send_data(sock.get(), type_name);
  const auto status = expect_status(sock.get());
  if (status == consts::kTokNone) {
    return std::nullopt;
  }
  if (status != consts::kTokOk) {
    throw std::runtime_error("unexpected reply to FIND: '" + status + "'");
  }
  return recv_data(sock.get());
}

bool TcpRemoteStore::contains(const std::string &uuid, const Credential &cred) {
  auto sock = open_request(host_, port_, timeout_ms_, cred, std::string(kOpHas) + uuid);
  const auto status = expect_status(sock.get());
  if (status == consts::kTokNone) {
    return false;
  }
  if (status != consts::kTokOk) {
    throw std::runtime_error("unexpected reply to HAS: '" + status + "'");
  }
  return true;
}

// ——— Server ———

StoreServer::StoreServer(RemoteStore &store, int timeout_ms)
    : store_(store), timeout_ms_(timeout_ms) {}

StoreServer::~StoreServer() {
  if (listen_fd_ != -1) {
    ::close(listen_fd_);
  }
}

void StoreServer::bind(const std::string &host, int port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    throw gai_error(rc, "getaddrinfo", host, port);
  }

  UniqueFd sock;
  int last_errno = 0;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    UniqueFd fd(::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
    if (!fd) {
      last_errno = errno;
      continue;
    }
    int yes = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(fd.get(), rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(fd.get(), 16) == 0) {
      sock = std::move(fd);
      break;
    }
    last_errno = errno;
  }
  ::freeaddrinfo(res);
  if (!sock) {
    throw std::system_error(last_errno, std::generic_category(), "bind " + host + ":" + port_s);
  }

  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(sock.get(), reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    throw std::system_error(errno, std::generic_category(), "getsockname");
  }
  port_ = addr.ss_family == AF_INET6 ? ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port)
                                     : ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);

  if (listen_fd_ != -1) {
    ::close(listen_fd_);
  }
  listen_fd_ = sock.release();
  SCIDATA_LOG_INFO("store server listening", {logging::StringField("host", host),
                                              logging::IntField("port", port_)});
}

void StoreServer::run() {
  if (listen_fd_ == -1) {
    throw std::runtime_error("StoreServer::run before bind");
  }
  while (!stopping_.load()) {
    UniqueFd client(::accept(listen_fd_, nullptr, nullptr));
    if (!client) {
      if (stopping_.load()) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "accept");
    }
    try {
      set_timeouts(client.get(), timeout_ms_);
      handle_client(client.get());
    } catch (const std::exception &e) {
      SCIDATA_LOG_WARN("store server: client dropped", {logging::StringField("error", e.what())});
    }
  }
}

void StoreServer::stop() {
  stopping_.store(true);
  if (listen_fd_ != -1) {
    ::shutdown(listen_fd_, SHUT_RDWR);
  }
}

void StoreServer::handle_client(int fd) {
  const auto hello = recv_line(fd);
  if (hello != consts::kHelloLine) {
    send_line(fd, std::string(consts::kTokErr) + "SchemaViolation unsupported protocol '" +
                      one_line(hello) + "'");
    return;
  }
  const auto auth = recv_line(fd);
  if (!std::string_view(auth).starts_with(consts::kTokAuth)) {
    send_line(fd, std::string(consts::kTokErr) + "NotOwner missing credential");
    return;
  }
  const Credential cred{.token = auth.substr(consts::kTokAuth.size())};
  const std::string op = recv_line(fd);
  const std::string_view opv = op;

  try {
    if (opv == consts::kOpCreate) {
      const auto archive = recv_data(fd);
      const auto accepted = store_.create(archive, cred);
      send_line(fd, consts::kTokOk);
      send_data(fd, Json(accepted).dump());
    } else if (opv.starts_with(consts::kOpReplace)) {
      const std::string uuid(opv.substr(consts::kOpReplace.size()));
      const auto archive = recv_data(fd);
      const auto accepted = store_.replace(uuid, archive, cred);
      send_line(fd, consts::kTokOk);
      send_data(fd, Json(accepted).dump());
    } else if (opv.starts_with(consts::kOpGet)) {
      const auto r = store_.get(std::string(opv.substr(consts::kOpGet.size())), cred);
      if (r.moved_to) {
        send_line(fd, std::string(consts::kTokRedirect) + *r.moved_to);
      } else {
        send_line(fd, consts::kTokOk);
        send_data(fd, *r.archive);
      }
    } else if (opv.starts_with(consts::kOpFind)) {
      const std::string hash(opv.substr(consts::kOpFind.size()));
      const auto name = recv_data(fd);
      const auto found = store_.find_static(std::string(name.begin(), name.end()), hash, cred);
      if (found) {
        send_line(fd, consts::kTokOk);
        send_data(fd, *found);
      } else {
        send_line(fd, consts::kTokNone);
      }
    } else if (opv.starts_with(kOpHas)) {
      const bool known = store_.contains(std::string(opv.substr(kOpHas.size())), cred);
      send_line(fd, known ? consts::kTokOk : consts::kTokNone);
    } else {
      send_line(fd, std::string(consts::kTokErr) + "SchemaViolation unknown op '" + one_line(op) +
                        "'");
    }
  } catch (const Error &e) {
    SCIDATA_LOG_DEBUG("store server: request rejected",
                      {logging::StringField("op", op), logging::StringField("kind", kind_name(e.kind())),
                       logging::StringField("error", e.what())});
    send_line(fd, std::string(consts::kTokErr) + std::string(kind_name(e.kind())) + " " +
                      one_line(e.what()));
  }
}

} // namespace scidata
