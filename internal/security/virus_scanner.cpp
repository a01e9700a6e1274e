#include "virus_scanner.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace ingest::security {

namespace {

constexpr std::size_t kStreamChunk = 64 * 1024;

class ClamdSocket {
 public:
  explicit ClamdSocket(const ClamdOptions& options) {
    if (!options.socket_path.empty()) {
      ConnectUnix(options.socket_path, options.timeout);
    } else {
      ConnectTcp(options.host, options.port, options.timeout);
    }
  }

  ~ClamdSocket() {
    if (fd_ >= 0) ::close(fd_);
  }

  ClamdSocket(const ClamdSocket&)            = delete;
  ClamdSocket& operator=(const ClamdSocket&) = delete;

  void Send(const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
      auto n = ::send(fd_, data + offset, size - offset, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) continue;
        throw std::runtime_error(std::string("clamd write: ") + std::strerror(errno));
      }
      offset += static_cast<std::size_t>(n);
    }
  }

  std::string ReadReply() {
    std::string reply;
    char        buffer[512];
    for (;;) {
      auto n = ::recv(fd_, buffer, sizeof(buffer), 0);
      if (n < 0) {
        if (errno == EINTR) continue;
        throw std::runtime_error(std::string("clamd read: ") + std::strerror(errno));
      }
      if (n == 0) break;
      reply.append(buffer, static_cast<std::size_t>(n));
      if (reply.back() == '\0') break;
    }
    return reply;
  }

 private:
  void ApplyTimeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }

  void ConnectUnix(const std::string& path, std::chrono::milliseconds timeout) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) throw std::runtime_error("clamd socket path too long: " + path);
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) throw std::runtime_error(std::string("clamd socket: ") + std::strerror(errno));
    ApplyTimeout(timeout);
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      throw std::runtime_error("clamd connect " + path + ": " + std::strerror(errno));
    }
  }

  void ConnectTcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo*   result = nullptr;
    std::string service = std::to_string(port);
    int         rc      = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) throw std::runtime_error("clamd resolve " + host + ": " + gai_strerror(rc));
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(result, &::freeaddrinfo);

    std::string last_error = "no address";
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
      fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd_ < 0) {
        last_error = std::strerror(errno);
        continue;
      }
      // SO_SNDTIMEO also bounds connect() on Linux.
      ApplyTimeout(timeout);
      if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) return;
      last_error = std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
    }
    throw std::runtime_error("clamd connect " + host + ":" + service + ": " + last_error);
  }

  int fd_ = -1;
};

} // namespace

ScanResult ParseClamdReply(std::string_view reply) {
  while (!reply.empty() && (reply.back() == '\0' || reply.back() == '\n')) reply.remove_suffix(1);

  if (auto colon = reply.find(": "); colon != std::string_view::npos) reply.remove_prefix(colon + 2);

  ScanResult result;
  if (reply == "OK") return result;

  constexpr std::string_view kFound = " FOUND";
  if (reply.size() > kFound.size() && reply.substr(reply.size() - kFound.size()) == kFound) {
    result.infected = true;
    result.viruses.emplace_back(reply.substr(0, reply.size() - kFound.size()));
    return result;
  }
  throw std::runtime_error("clamd: " + std::string(reply));
}

ClamdScanner::ClamdScanner(ClamdOptions options) : options_(std::move(options)) {
}

ScanResult ClamdScanner::Scan(std::string_view data, const std::string& name) {
  ClamdSocket socket(options_);

  static constexpr char kCommand[] = "zINSTREAM";
  socket.Send(kCommand, sizeof(kCommand)); // includes the terminating NUL

  for (std::size_t offset = 0; offset < data.size(); offset += kStreamChunk) {
    const auto     size   = std::min(kStreamChunk, data.size() - offset);
    const uint32_t length = htonl(static_cast<uint32_t>(size));
    socket.Send(reinterpret_cast<const char*>(&length), sizeof(length));
    socket.Send(data.data() + offset, size);
  }
  const uint32_t terminator = 0;
  socket.Send(reinterpret_cast<const char*>(&terminator), sizeof(terminator));

  auto result = ParseClamdReply(socket.ReadReply());
  if (result.infected) {
    INGEST_LOG_WARN("virus detected", {observability::StringField("name", name), observability::StringField("signature", result.viruses.front())});
  } else {
    INGEST_LOG_DEBUG("virus scan clean", {observability::StringField("name", name),
                                          observability::IntField("bytes", static_cast<int64_t>(data.size()))});
  }
  return result;
}

} // namespace ingest::security
