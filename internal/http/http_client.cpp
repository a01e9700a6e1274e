#include "http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <stdexcept>

#include "internal/util/encoding.hpp"
#include "internal/util/filename.hpp"

namespace ingest::http {

namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;
using Clock     = std::chrono::steady_clock;

constexpr std::uint64_t kMaxResponseBytes = 64ULL * 1024 * 1024;

/*
  Drives one asynchronous operation on the calling thread until it
  completes or the deadline passes. On overrun the operation is cancelled
  and drained before the timeout is reported, so no handler outlives the
  call.
*/
template <class Initiate, class Cancel>
void RunUntil(net::io_context& ioc, Clock::time_point deadline, const std::string& what, Initiate&& initiate, Cancel&& cancel) {
  bool              done = false;
  beast::error_code ec;
  initiate([&done, &ec](const beast::error_code& result, auto&&...) {
    done = true;
    ec   = result;
  });

  ioc.restart();
  ioc.run_until(deadline);
  if (!done) {
    cancel();
    ioc.restart();
    ioc.run();
    throw std::runtime_error(what + " timed out");
  }
  if (ec == beast::error::timeout) throw std::runtime_error(what + " timed out");
  if (ec) throw std::runtime_error(what + ": " + ec.message());
}

ssl::context& TlsContext() {
  static ssl::context ctx = [] {
    ssl::context c(ssl::context::tls_client);
    c.set_default_verify_paths();
    c.set_verify_mode(ssl::verify_peer);
    c.set_options(ssl::context::no_sslv2 | ssl::context::no_sslv3 | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);
    return c;
  }();
  return ctx;
}

bhttp::request<bhttp::string_body> BuildRequest(const HttpRequest& request, const Url& url) {
  const auto verb = bhttp::string_to_verb(request.method);
  if (verb == bhttp::verb::unknown) throw std::invalid_argument("unsupported http method: " + request.method);

  bhttp::request<bhttp::string_body> req{verb, url.target, 11};
  const bool default_port = (url.scheme == "https" && url.port == 443) || (url.scheme == "http" && url.port == 80);
  req.set(bhttp::field::host, default_port ? url.host : url.host + ":" + std::to_string(url.port));
  req.set(bhttp::field::user_agent, "ingest-manager");
  req.set(bhttp::field::connection, "close");
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  req.body() = request.body;
  if (!request.body.empty() || verb == bhttp::verb::post || verb == bhttp::verb::put) {
    req.prepare_payload();
  }
  return req;
}

HttpResponse ToResponse(bhttp::response<bhttp::string_body>&& res) {
  HttpResponse response;
  response.status = static_cast<int>(res.result_int());
  for (const auto& field : res) {
    response.headers[util::ToLower(std::string(field.name_string()))] = std::string(field.value());
  }
  response.body = std::move(res.body());
  return response;
}

/*
  Write the request and read the response on an already connected stream.
  Beast handles Content-Length, chunked bodies and connection-close framing.
*/
template <class Stream>
HttpResponse Exchange(net::io_context& ioc, Stream& stream, Clock::time_point deadline, bhttp::request<bhttp::string_body>& req) {
  auto close = [&stream] { beast::get_lowest_layer(stream).close(); };

  RunUntil(
      ioc, deadline, "http write", [&](auto handler) { bhttp::async_write(stream, req, std::move(handler)); }, close);

  beast::flat_buffer                         buffer;
  bhttp::response_parser<bhttp::string_body> parser;
  parser.body_limit(kMaxResponseBytes);
  RunUntil(
      ioc, deadline, "http read", [&](auto handler) { bhttp::async_read(stream, buffer, parser, std::move(handler)); }, close);

  return ToResponse(parser.release());
}

} // namespace

Url ParseUrl(const std::string& url) {
  Url  out;
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) throw std::invalid_argument("url without scheme: " + url);

  out.scheme = util::ToLower(url.substr(0, scheme_end));
  if (out.scheme != "http" && out.scheme != "https") throw std::invalid_argument("unsupported url scheme: " + out.scheme);

  auto authority_start = scheme_end + 3;
  auto path_start      = url.find_first_of("/?", authority_start);
  auto authority       = url.substr(authority_start, path_start == std::string::npos ? std::string::npos : path_start - authority_start);
  if (authority.empty()) throw std::invalid_argument("url without host: " + url);

  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = static_cast<uint16_t>(std::stoi(authority.substr(colon + 1)));
  } else {
    out.host = authority;
    out.port = out.scheme == "https" ? 443 : 80;
  }

  out.target = path_start == std::string::npos ? "/" : url.substr(path_start);
  if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
  return out;
}

BeastHttpClient::BeastHttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

HttpResponse BeastHttpClient::Send(const HttpRequest& request) {
  const auto url      = ParseUrl(request.url);
  auto       req      = BuildRequest(request, url);
  const auto deadline = Clock::now() + timeout_;

  net::io_context         ioc;
  tcp::resolver           resolver(ioc);
  tcp::resolver::results_type endpoints;
  RunUntil(
      ioc, deadline, "resolve " + url.host,
      [&](auto handler) {
        resolver.async_resolve(url.host, std::to_string(url.port),
                               [&endpoints, handler = std::move(handler)](const beast::error_code& ec, tcp::resolver::results_type results) mutable {
                                 endpoints = std::move(results);
                                 handler(ec);
                               });
      },
      [&resolver] { resolver.cancel(); });

  HttpResponse response;
  if (url.scheme == "https") {
    beast::ssl_stream<beast::tcp_stream> stream(ioc, TlsContext());
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      throw std::runtime_error("tls: cannot set SNI for " + url.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_at(deadline);
    auto close = [&lowest] { lowest.close(); };

    RunUntil(
        ioc, deadline, "connect " + url.host, [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); }, close);
    RunUntil(
        ioc, deadline, "tls handshake with " + url.host,
        [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); }, close);

    response = Exchange(ioc, stream, deadline, req);
  } else {
    beast::tcp_stream stream(ioc);
    stream.expires_at(deadline);
    auto close = [&stream] { stream.close(); };

    RunUntil(
        ioc, deadline, "connect " + url.host, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); }, close);

    response = Exchange(ioc, stream, deadline, req);
  }

  spdlog::debug("http {} {}://{}{} -> {}", request.method, url.scheme, url.host, url.target.substr(0, url.target.find('?')), response.status);
  return response;
}

MultipartForm::MultipartForm() : boundary_("----ingest" + util::RandomSuffix(24)) {
}

void MultipartForm::AddField(const std::string& name, const std::string& value) {
  body_ += "--" + boundary_ + "\r\n";
  body_ += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
  body_ += value + "\r\n";
}

void MultipartForm::AddFile(const std::string& name, const std::string& filename, const std::string& content_type, const std::string& data) {
  body_ += "--" + boundary_ + "\r\n";
  body_ += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename + "\"\r\n";
  body_ += "Content-Type: " + content_type + "\r\n\r\n";
  body_ += data;
  body_ += "\r\n";
}

std::string MultipartForm::ContentType() const {
  return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartForm::Body() const {
  return body_ + "--" + boundary_ + "--\r\n";
}

} // namespace ingest::http
