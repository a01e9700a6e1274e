#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cassert>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/security/virus_scanner.hpp"

namespace {

using ingest::security::ClamdOptions;
using ingest::security::ClamdScanner;
using ingest::security::ParseClamdReply;

void TestParseReplies() {
  auto clean = ParseClamdReply(std::string("stream: OK\0", 11));
  assert(!clean.infected);
  assert(clean.viruses.empty());

  auto infected = ParseClamdReply("stream: Eicar-Test-Signature FOUND\n");
  assert(infected.infected);
  assert(infected.viruses.size() == 1);
  assert(infected.viruses[0] == "Eicar-Test-Signature");

  bool threw = false;
  try {
    (void)ParseClamdReply("INSTREAM size limit exceeded. ERROR");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

// One-shot clamd stand-in on a unix socket: decodes the zINSTREAM body and answers.
class FakeClamd {
 public:
  explicit FakeClamd(std::string reply) : reply_(std::move(reply)) {
    path_ = "/tmp/ingest-clamd-" + std::to_string(::getpid()) + ".sock";
    ::unlink(path_.c_str());

    fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 1) != 0) {
      throw std::runtime_error("fake clamd could not listen on " + path_);
    }

    thread_ = std::thread([this] { Serve(); });
  }

  ~FakeClamd() {
    Join();
    ::close(fd_);
    ::unlink(path_.c_str());
  }

  void Join() {
    if (thread_.joinable()) thread_.join();
  }

  const std::string& path() const {
    return path_;
  }

  std::string command;
  std::string streamed;

 private:
  bool ReadExact(int fd, char* out, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
      auto n = ::recv(fd, out + offset, size - offset, 0);
      if (n <= 0) return false;
      offset += static_cast<std::size_t>(n);
    }
    return true;
  }

  void Serve() {
    int client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) return;

    char c = 0;
    while (ReadExact(client, &c, 1) && c != '\0') command.push_back(c);

    for (;;) {
      uint32_t length = 0;
      if (!ReadExact(client, reinterpret_cast<char*>(&length), sizeof(length))) break;
      length = ntohl(length);
      if (length == 0) break;
      std::string chunk(length, '\0');
      if (!ReadExact(client, chunk.data(), length)) break;
      streamed += chunk;
    }

    ::send(client, reply_.data(), reply_.size(), MSG_NOSIGNAL);
    ::close(client);
  }

  std::string reply_;
  std::string path_;
  int         fd_ = -1;
  std::thread thread_;
};

void TestStreamsContent() {
  // Larger than one 64 KiB stream chunk.
  std::string content(200 * 1024, 'x');
  content.back() = 'y';

  FakeClamd    clamd(std::string("stream: OK\0", 11));
  ClamdOptions options;
  options.socket_path = clamd.path();
  ClamdScanner scanner(options);

  auto result = scanner.Scan(content, "big.bin");
  clamd.Join();

  assert(!result.infected);
  assert(clamd.command == "zINSTREAM");
  assert(clamd.streamed == content);
}

void TestReportsSignature() {
  FakeClamd    clamd(std::string("stream: Win.Test.EICAR_HDB-1 FOUND\0", 35));
  ClamdOptions options;
  options.socket_path = clamd.path();
  ClamdScanner scanner(options);

  auto result = scanner.Scan("payload", "eicar.txt");
  clamd.Join();

  assert(result.infected);
  assert(result.viruses.at(0) == "Win.Test.EICAR_HDB-1");
}

void TestUnreachableScannerThrows() {
  ClamdOptions options;
  options.socket_path = "/tmp/ingest-clamd-missing-" + std::to_string(::getpid()) + ".sock";
  ClamdScanner scanner(options);

  bool threw = false;
  try {
    (void)scanner.Scan("data", "a.txt");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseReplies();
  TestStreamsContent();
  TestReportsSignature();
  TestUnreachableScannerThrows();
  std::cout << "ingest_manager_unit_virus_scanner: pass\n";
  return 0;
}
