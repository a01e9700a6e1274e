#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ingest::http {

struct Url {
  std::string scheme;
  std::string host;
  uint16_t    port = 0;
  std::string target; // path + query, always starts with '/'
};

// Throws std::invalid_argument for anything that is not http(s)://host[:port]/...
Url ParseUrl(const std::string& url);

struct HttpRequest {
  std::string                                      method = "GET";
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
};

struct HttpResponse {
  int                                status = 0;
  std::map<std::string, std::string> headers; // lowercased names
  std::string                        body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

/*
  Minimal blocking HTTP/1.1 client seam.

  Providers talk to remote APIs through this interface so tests can
  replace the network with a scripted fake. Send throws on transport
  errors (DNS, connect, TLS, timeout); HTTP error statuses are returned.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

/*
  BeastHttpClient

  One connection per request ("Connection: close"), over Boost.Beast.
  https verifies the peer certificate and host name and sends SNI.
  The timeout is a deadline for the whole exchange (resolve, connect,
  handshake, write and read), not a per-read limit.
*/
class BeastHttpClient final : public HttpClient {
 public:
  explicit BeastHttpClient(std::chrono::milliseconds timeout);

  HttpResponse Send(const HttpRequest& request) override;

 private:
  std::chrono::milliseconds timeout_;
};

/*
  multipart/form-data builder.
*/
class MultipartForm {
 public:
  MultipartForm();

  void AddField(const std::string& name, const std::string& value);
  void AddFile(const std::string& name, const std::string& filename, const std::string& content_type, const std::string& data);

  std::string ContentType() const;
  std::string Body() const;

 private:
  std::string boundary_;
  std::string body_;
};

} // namespace ingest::http
