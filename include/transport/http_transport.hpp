#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "transport/endpoint.hpp"
#include "util/my_logging.hpp"

namespace aigate {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Incrementally read response. Status and headers are available as soon as
// the object exists; the body is pulled with read_some().
class IResponseStream {
public:
  virtual ~IResponseStream() = default;

  virtual int status() const = 0;
  virtual const http::fields &headers() const = 0;

  // Next piece of the body, std::nullopt at end of body or after close().
  // Throws ApiException with Timeout or StreamInterrupted on I/O failure.
  virtual std::optional<std::string> read_some() = 0;

  // Callable from any thread; a blocked read_some() returns std::nullopt.
  virtual void close() = 0;

  std::string read_all() {
    std::string body;
    while (auto piece = read_some()) {
      body += *piece;
    }
    return body;
  }
};

// Request targets are paths relative to the configured endpoint. Failures
// are thrown as ApiException: Timeout when a deadline expires, otherwise
// NetworkFailure.
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse execute(const HttpRequest &req,
                               std::chrono::seconds timeout) = 0;

  // Returns once the response header has been read. read_timeout applies to
  // each subsequent body read.
  virtual std::unique_ptr<IResponseStream>
  open_stream(const HttpRequest &req, std::chrono::seconds timeout,
              std::chrono::seconds read_timeout) = 0;
};

// One connection per request over Boost.Beast; TLS when the endpoint scheme
// is https.
class BeastHttpTransport : public IHttpTransport {
public:
  BeastHttpTransport(Endpoint endpoint, bool verify_tls);

  HttpResponse execute(const HttpRequest &req,
                       std::chrono::seconds timeout) override;
  std::unique_ptr<IResponseStream>
  open_stream(const HttpRequest &req, std::chrono::seconds timeout,
              std::chrono::seconds read_timeout) override;

  const Endpoint &endpoint() const { return endpoint_; }

private:
  HttpRequest prepare(const HttpRequest &req) const;

  Endpoint endpoint_;
  bool verify_tls_;
  boost::asio::ssl::context ssl_ctx_;
  Logger lg;
};

} // namespace aigate
