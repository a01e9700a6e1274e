#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/http/http_client.hpp"

namespace {

using ingest::http::BeastHttpClient;
using ingest::http::HttpRequest;
using ingest::http::ParseUrl;

// One-shot HTTP stand-in on 127.0.0.1: reads a request, then hands the socket to the script.
class FakeHttpServer {
 public:
  using Script = std::function<void(int client)>;

  explicit FakeHttpServer(Script script) : script_(std::move(script)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    socklen_t len        = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 1) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      throw std::runtime_error("fake http server could not listen");
    }
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { Serve(); });
  }

  ~FakeHttpServer() {
    Join();
    ::close(fd_);
  }

  void Join() {
    if (thread_.joinable()) thread_.join();
  }

  std::string Url(const std::string& target) const {
    return "http://127.0.0.1:" + std::to_string(port_) + target;
  }

  std::string request;

 private:
  void ReadRequest(int client) {
    char buffer[4096];
    for (;;) {
      auto header_end = request.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        std::size_t length = 0;
        auto        cl     = request.find("Content-Length: ");
        if (cl != std::string::npos && cl < header_end) length = std::stoul(request.substr(cl + 16));
        if (request.size() >= header_end + 4 + length) return;
      }
      auto n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) return;
      request.append(buffer, static_cast<std::size_t>(n));
    }
  }

  void Serve() {
    int client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) return;
    ReadRequest(client);
    script_(client);
    ::close(client);
  }

  Script      script_;
  int         fd_   = -1;
  uint16_t    port_ = 0;
  std::thread thread_;
};

bool SendAll(int client, const std::string& data) {
  return ::send(client, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
}

void TestParseUrl() {
  auto url = ParseUrl("https://api.example.com/v1_1/demo/image/upload?x=1");
  assert(url.scheme == "https");
  assert(url.host == "api.example.com");
  assert(url.port == 443);
  assert(url.target == "/v1_1/demo/image/upload?x=1");

  auto local = ParseUrl("http://127.0.0.1:8080?q");
  assert(local.port == 8080);
  assert(local.target == "/?q");

  bool threw = false;
  try {
    (void)ParseUrl("ftp://example.com/a");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestChunkedResponse() {
  FakeHttpServer server([](int client) {
    SendAll(client,
            "HTTP/1.1 201 Created\r\nTransfer-Encoding: chunked\r\nX-Request-Id: abc\r\n\r\n"
            "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
  });

  HttpRequest request;
  request.method = "POST";
  request.url    = server.Url("/v1/upload?x=1");
  request.headers.emplace_back("Content-Type", "text/plain");
  request.body = "payload";

  BeastHttpClient client(std::chrono::milliseconds(5000));
  auto            response = client.Send(request);
  server.Join();

  assert(response.status == 201);
  assert(response.Ok());
  assert(response.body == "hello world");
  assert(response.headers.at("x-request-id") == "abc");

  assert(server.request.rfind("POST /v1/upload?x=1 HTTP/1.1\r\n", 0) == 0);
  assert(server.request.find("Content-Length: 7\r\n") != std::string::npos);
  assert(server.request.find("Content-Type: text/plain\r\n") != std::string::npos);
  assert(server.request.size() >= 7 && server.request.compare(server.request.size() - 7, 7, "payload") == 0);
}

void TestErrorStatusIsReturned() {
  FakeHttpServer server([](int client) { SendAll(client, "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nnot found"); });

  HttpRequest request;
  request.url = server.Url("/missing");

  BeastHttpClient client(std::chrono::milliseconds(5000));
  auto            response = client.Send(request);
  server.Join();

  assert(response.status == 404);
  assert(!response.Ok());
  assert(response.body == "not found");
}

// A peer that keeps the connection alive with a byte at a time must still hit the deadline.
void TestSlowBodyHitsDeadline() {
  FakeHttpServer server([](int client) {
    if (!SendAll(client, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n")) return;
    for (int i = 0; i < 100; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      if (!SendAll(client, "x")) return;
    }
  });

  HttpRequest request;
  request.url = server.Url("/slow");

  BeastHttpClient client(std::chrono::milliseconds(300));
  const auto      start = std::chrono::steady_clock::now();
  std::string     error;
  try {
    (void)client.Send(request);
  } catch (const std::runtime_error& e) {
    error = e.what();
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  server.Join();

  assert(error.find("timed out") != std::string::npos);
  assert(elapsed < std::chrono::seconds(2));
}

void TestConnectionRefused() {
  // Bind and close to find a port nothing listens on.
  int         fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len        = sizeof(addr);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    throw std::runtime_error("could not reserve a port");
  }
  const auto port = ntohs(addr.sin_port);
  ::close(fd);

  HttpRequest request;
  request.url = "http://127.0.0.1:" + std::to_string(port) + "/";

  BeastHttpClient client(std::chrono::milliseconds(1000));
  bool            threw = false;
  try {
    (void)client.Send(request);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseUrl();
  TestChunkedResponse();
  TestErrorStatusIsReturned();
  TestSlowBodyHitsDeadline();
  TestConnectionRefused();
  std::cout << "ingest_manager_unit_http_client: pass\n";
  return 0;
}
