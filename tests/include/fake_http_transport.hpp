#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "api/api_error.hpp"
#include "transport/http_transport.hpp"

namespace testinfra {

namespace http = boost::beast::http;

inline aigate::HttpResponse
make_response(int status, std::string body,
              std::vector<std::pair<std::string, std::string>> headers = {}) {
  aigate::HttpResponse resp{static_cast<http::status>(status), 11};
  for (auto &[name, value] : headers) {
    resp.set(name, value);
  }
  resp.body() = std::move(body);
  resp.prepare_payload();
  return resp;
}

struct FakeStreamSpec {
  int status{200};
  std::vector<std::pair<std::string, std::string>> headers;
  std::vector<std::string> pieces;
  // Thrown by read_some() once all pieces have been handed out.
  std::optional<aigate::Error> fail_at_end;
  // read_some() blocks after the last piece until close() is called.
  bool hang_at_end{false};
};

class FakeResponseStream : public aigate::IResponseStream {
public:
  explicit FakeResponseStream(FakeStreamSpec spec)
      : spec_(std::move(spec)), pending_(spec_.pieces.begin(),
                                         spec_.pieces.end()) {
    for (auto &[name, value] : spec_.headers) {
      fields_.set(name, value);
    }
  }

  int status() const override { return spec_.status; }
  const http::fields &headers() const override { return fields_; }

  std::optional<std::string> read_some() override {
    std::unique_lock lock(mutex_);
    if (closed_) {
      return std::nullopt;
    }
    if (!pending_.empty()) {
      auto piece = std::move(pending_.front());
      pending_.pop_front();
      ++pieces_read_;
      return piece;
    }
    if (spec_.fail_at_end) {
      throw aigate::ApiException(*spec_.fail_at_end);
    }
    if (spec_.hang_at_end) {
      cv_.wait(lock, [this] { return closed_; });
    }
    return std::nullopt;
  }

  void close() override {
    std::lock_guard lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t pieces_read() const {
    std::lock_guard lock(mutex_);
    return pieces_read_;
  }

private:
  FakeStreamSpec spec_;
  http::fields fields_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  std::size_t pieces_read_{0};
  bool closed_{false};
};

// Answers requests from a handler function and records everything sent.
class FakeHttpTransport : public aigate::IHttpTransport {
public:
  using Handler = std::function<aigate::HttpResponse(const aigate::HttpRequest &)>;
  using StreamHandler = std::function<FakeStreamSpec(const aigate::HttpRequest &)>;

  Handler on_execute;
  StreamHandler on_stream;

  aigate::HttpResponse execute(const aigate::HttpRequest &req,
                               std::chrono::seconds) override {
    record(req);
    if (!on_execute) {
      throw aigate::ApiException(
          aigate::make_error(aigate::ErrorKind::NetworkFailure, "no handler"));
    }
    return on_execute(req);
  }

  std::unique_ptr<aigate::IResponseStream>
  open_stream(const aigate::HttpRequest &req, std::chrono::seconds,
              std::chrono::seconds read_timeout) override {
    record(req);
    last_read_timeout = read_timeout;
    auto stream = std::make_unique<FakeResponseStream>(on_stream(req));
    std::lock_guard lock(mutex_);
    last_stream_ = stream.get();
    return stream;
  }

  std::vector<aigate::HttpRequest> requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::vector<std::string> targets() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    for (const auto &r : requests_) {
      out.emplace_back(r.target());
    }
    return out;
  }

  // Owned by the stream's consumer; valid while that consumer holds it.
  FakeResponseStream *last_stream() const {
    std::lock_guard lock(mutex_);
    return last_stream_;
  }

  std::chrono::seconds last_read_timeout{0};

private:
  void record(const aigate::HttpRequest &req) {
    std::lock_guard lock(mutex_);
    requests_.push_back(req);
  }

  mutable std::mutex mutex_;
  std::vector<aigate::HttpRequest> requests_;
  FakeResponseStream *last_stream_{nullptr};
};

} // namespace testinfra
