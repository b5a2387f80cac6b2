#include "transport/http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>
#include <openssl/err.h>

#include <array>
#include <atomic>
#include <limits>
#include <type_traits>

#include "api/api_error.hpp"

namespace aigate {
namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = ssl::stream<beast::tcp_stream>;

constexpr std::uint64_t kMaxBufferedBody = 64ull * 1024 * 1024;

[[noreturn]] void throw_transport(const beast::error_code &ec,
                                  const char *stage, ErrorKind fallback) {
  const ErrorKind kind =
      ec == beast::error::timeout ? ErrorKind::Timeout : fallback;
  throw ApiException(
      make_error(kind, fmt::format("{} failed: {}", stage, ec.message())));
}

// Each request owns its io_context; asynchronous operations are driven to
// completion on the calling thread so the stream deadlines apply.
void drive(net::io_context &ioc) {
  ioc.restart();
  ioc.run();
}

template <class Stream> struct Connection {
  net::io_context ioc;
  Stream stream;
  beast::flat_buffer buffer;

  Connection() : stream(ioc) {}
  explicit Connection(ssl::context &ctx) : stream(ioc, ctx) {}
};

template <class Stream>
void connect(Connection<Stream> &conn, const Endpoint &ep, bool verify_tls,
             std::chrono::seconds timeout) {
  beast::error_code ec;

  tcp::resolver resolver(conn.ioc);
  net::steady_timer deadline(conn.ioc);
  bool resolve_timed_out = false;
  tcp::resolver::results_type results;
  deadline.expires_after(timeout);
  deadline.async_wait([&](const beast::error_code &wait_ec) {
    if (!wait_ec) {
      resolve_timed_out = true;
      resolver.cancel();
    }
  });
  resolver.async_resolve(ep.host, ep.port,
                         [&](const beast::error_code &e,
                             tcp::resolver::results_type r) {
                           ec = e;
                           results = std::move(r);
                           deadline.cancel();
                         });
  drive(conn.ioc);
  if (resolve_timed_out) {
    throw_transport(beast::error::timeout, "resolve", ErrorKind::Timeout);
  }
  if (ec) {
    throw_transport(ec, "resolve", ErrorKind::NetworkFailure);
  }

  beast::get_lowest_layer(conn.stream).expires_after(timeout);
  beast::get_lowest_layer(conn.stream)
      .async_connect(results, [&](const beast::error_code &e,
                                  const tcp::endpoint &) { ec = e; });
  drive(conn.ioc);
  if (ec) {
    throw_transport(ec, "connect", ErrorKind::NetworkFailure);
  }

  if constexpr (std::is_same_v<Stream, TlsStream>) {
    if (!SSL_set_tlsext_host_name(conn.stream.native_handle(),
                                  ep.host.c_str())) {
      beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                  net::error::get_ssl_category()};
      throw_transport(sni_error, "set_sni", ErrorKind::NetworkFailure);
    }
    if (verify_tls) {
      conn.stream.set_verify_callback(ssl::host_name_verification(ep.host));
    }
    beast::get_lowest_layer(conn.stream).expires_after(timeout);
    conn.stream.async_handshake(ssl::stream_base::client,
                                [&](const beast::error_code &e) { ec = e; });
    drive(conn.ioc);
    if (ec) {
      throw_transport(ec, "tls_handshake", ErrorKind::NetworkFailure);
    }
  }
}

template <class Stream>
void write_request(Connection<Stream> &conn, const HttpRequest &req,
                   std::chrono::seconds timeout) {
  beast::error_code ec;
  beast::get_lowest_layer(conn.stream).expires_after(timeout);
  http::async_write(conn.stream, req,
                    [&](const beast::error_code &e, std::size_t) { ec = e; });
  drive(conn.ioc);
  if (ec) {
    throw_transport(ec, "write", ErrorKind::NetworkFailure);
  }
}

template <class Stream> void shutdown(Connection<Stream> &conn) {
  beast::error_code ec;
  if constexpr (std::is_same_v<Stream, TlsStream>) {
    beast::get_lowest_layer(conn.stream).expires_after(std::chrono::seconds(2));
    conn.stream.async_shutdown([&](const beast::error_code &e) { ec = e; });
    drive(conn.ioc);
  }
  // Peers routinely drop the connection first; nothing to report.
  beast::get_lowest_layer(conn.stream).socket().shutdown(tcp::socket::shutdown_both, ec);
}

template <class Stream>
HttpResponse execute_on(Connection<Stream> &conn, const Endpoint &ep,
                        bool verify_tls, const HttpRequest &req,
                        std::chrono::seconds timeout) {
  connect(conn, ep, verify_tls, timeout);
  write_request(conn, req, timeout);

  beast::error_code ec;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxBufferedBody);
  beast::get_lowest_layer(conn.stream).expires_after(timeout);
  http::async_read(conn.stream, conn.buffer, parser,
                   [&](const beast::error_code &e, std::size_t) { ec = e; });
  drive(conn.ioc);
  if (ec) {
    throw_transport(ec, "read", ErrorKind::NetworkFailure);
  }
  shutdown(conn);
  return parser.release();
}

template <class Stream> class BeastResponseStream : public IResponseStream {
public:
  BeastResponseStream(std::unique_ptr<Connection<Stream>> conn,
                      std::chrono::seconds read_timeout)
      : conn_(std::move(conn)), read_timeout_(read_timeout) {
    parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
  }

  void read_header(std::chrono::seconds timeout) {
    beast::error_code ec;
    beast::get_lowest_layer(conn_->stream).expires_after(timeout);
    http::async_read_header(
        conn_->stream, conn_->buffer, parser_,
        [&](const beast::error_code &e, std::size_t) { ec = e; });
    drive(conn_->ioc);
    if (ec) {
      throw_transport(ec, "read_header", ErrorKind::NetworkFailure);
    }
  }

  int status() const override { return parser_.get().result_int(); }

  const http::fields &headers() const override { return parser_.get(); }

  std::optional<std::string> read_some() override {
    if (closed_.load() || parser_.is_done()) {
      return std::nullopt;
    }
    parser_.get().body().data = chunk_.data();
    parser_.get().body().size = chunk_.size();
    parser_.get().body().more = true;

    beast::error_code ec;
    beast::get_lowest_layer(conn_->stream).expires_after(read_timeout_);
    http::async_read(conn_->stream, conn_->buffer, parser_,
                     [&](const beast::error_code &e, std::size_t) { ec = e; });
    drive(conn_->ioc);

    if (closed_.load()) {
      return std::nullopt;
    }
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      throw_transport(ec, "stream read", ErrorKind::StreamInterrupted);
    }
    const std::size_t filled = chunk_.size() - parser_.get().body().size;
    if (filled == 0 && parser_.is_done()) {
      return std::nullopt;
    }
    return std::string(chunk_.data(), filled);
  }

  void close() override {
    if (closed_.exchange(true)) {
      return;
    }
    net::post(conn_->ioc, [conn = conn_.get()] {
      beast::error_code ignored;
      beast::get_lowest_layer(conn->stream).socket().close(ignored);
    });
  }

private:
  std::unique_ptr<Connection<Stream>> conn_;
  http::response_parser<http::buffer_body> parser_;
  std::chrono::seconds read_timeout_;
  std::array<char, 8192> chunk_{};
  std::atomic<bool> closed_{false};
};

template <class Stream>
std::unique_ptr<IResponseStream>
open_stream_on(std::unique_ptr<Connection<Stream>> conn, const Endpoint &ep,
               bool verify_tls, const HttpRequest &req,
               std::chrono::seconds timeout, std::chrono::seconds read_timeout) {
  connect(*conn, ep, verify_tls, timeout);
  write_request(*conn, req, timeout);
  auto stream = std::make_unique<BeastResponseStream<Stream>>(std::move(conn),
                                                              read_timeout);
  stream->read_header(timeout);
  return stream;
}

} // namespace

BeastHttpTransport::BeastHttpTransport(Endpoint endpoint, bool verify_tls)
    : endpoint_(std::move(endpoint)), verify_tls_(verify_tls),
      ssl_ctx_(ssl::context::tlsv12_client) {
  if (verify_tls_) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
  } else {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "TLS certificate verification disabled for " << endpoint_.host;
    ssl_ctx_.set_verify_mode(ssl::verify_none);
  }
}

HttpRequest BeastHttpTransport::prepare(const HttpRequest &req) const {
  HttpRequest out = req;
  out.version(11);
  out.target(endpoint_.target_for(std::string(req.target())));
  out.set(http::field::host, endpoint_.host_header());
  out.set(http::field::connection, "close");
  out.prepare_payload();
  return out;
}

HttpResponse BeastHttpTransport::execute(const HttpRequest &req,
                                         std::chrono::seconds timeout) {
  const HttpRequest prepared = prepare(req);
  BOOST_LOG_SEV(lg, trivial::debug)
      << prepared.method_string() << " " << prepared.target();
  if (endpoint_.tls) {
    Connection<TlsStream> conn(ssl_ctx_);
    return execute_on(conn, endpoint_, verify_tls_, prepared, timeout);
  }
  Connection<PlainStream> conn;
  return execute_on(conn, endpoint_, verify_tls_, prepared, timeout);
}

std::unique_ptr<IResponseStream>
BeastHttpTransport::open_stream(const HttpRequest &req,
                                std::chrono::seconds timeout,
                                std::chrono::seconds read_timeout) {
  const HttpRequest prepared = prepare(req);
  BOOST_LOG_SEV(lg, trivial::debug)
      << "stream " << prepared.method_string() << " " << prepared.target();
  if (endpoint_.tls) {
    return open_stream_on(std::make_unique<Connection<TlsStream>>(ssl_ctx_),
                          endpoint_, verify_tls_, prepared, timeout,
                          read_timeout);
  }
  return open_stream_on(std::make_unique<Connection<PlainStream>>(), endpoint_,
                        verify_tls_, prepared, timeout, read_timeout);
}

} // namespace aigate
