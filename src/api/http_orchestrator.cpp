#include "api/http_orchestrator.hpp"

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include "api/error_classifier.hpp"
#include "version.h"

namespace aigate {

namespace {

bool is_success(int status) { return status >= 200 && status < 300; }

std::string serialize_body(const json::value &body) {
  try {
    return json::serialize(body);
  } catch (const std::exception &e) {
    throw ApiException(make_error(ErrorKind::EncodingFailed, e.what()));
  }
}

} // namespace

HttpOrchestrator::HttpOrchestrator(
    IAigateConfigProvider &config_provider,
    std::shared_ptr<IHttpTransport> transport,
    std::shared_ptr<IAttestationProvider> attestation,
    IReplayCounter &replay_counter, device::DeviceInfo device_info)
    : config_provider_(config_provider), transport_(std::move(transport)),
      attestation_(std::move(attestation)), replay_counter_(replay_counter),
      signer_(config_provider.get().api_key, config_provider.get().bundle_id),
      user_agent_(
          fmt::format("aigate/{} {}", MYAPP_VERSION, device::platform_tag())),
      pool_(static_cast<std::size_t>(config_provider.get().worker_threads)) {
  if (attestation_) {
    registrar_ = std::make_unique<DeviceRegistrar>(
        attestation_,
        [this](std::string_view path, const json::value &body) {
          return send_once(http::verb::post, std::string(path), body).data;
        },
        config_provider_.get().bundle_id, team_id(), std::move(device_info));
  }
  BOOST_LOG_SEV(lg, trivial::debug)
      << "orchestrator ready, attestation="
      << (attestation_ ? attestation_->variant() : "none");
}

HttpOrchestrator::~HttpOrchestrator() { pool_.join(); }

std::optional<std::string> HttpOrchestrator::team_id() const {
  std::string id = config_provider_.get().team_id;
  const auto first = id.find_first_not_of('.');
  if (first == std::string::npos) {
    return std::nullopt;
  }
  const auto last = id.find_last_not_of('.');
  return id.substr(first, last - first + 1);
}

std::chrono::seconds HttpOrchestrator::timeout() const {
  return std::chrono::seconds(config_provider_.get().timeout_seconds);
}

HttpRequest HttpOrchestrator::build_request(
    http::verb method, const std::string &path,
    const std::optional<std::string> &body) {
  const auto &cfg = config_provider_.get();
  HttpRequest req{method, path, 11};

  if (body) {
    req.set(http::field::content_type, "application/json");
  }
  req.set(http::field::authorization, "Bearer " + cfg.api_key);
  req.set("X-Bundle-Id", cfg.bundle_id);
  if (auto team = team_id()) {
    req.set("X-Team-Id", *team);
  }
  req.set(http::field::user_agent, user_agent_);
  req.set("X-Environment", environment_tag(cfg.environment));

  const auto envelope = body ? signer_.sign(std::string_view(*body))
                             : signer_.sign(std::nullopt);
  req.set("X-Timestamp", std::to_string(envelope.timestamp));
  req.set("X-Nonce", envelope.nonce);
  req.set("X-Signature", envelope.signature);

  if (body) {
    attach_attestation(req, *body);
    req.body() = *body;
  }
  req.prepare_payload();
  return req;
}

void HttpOrchestrator::attach_attestation(HttpRequest &req,
                                          const std::string &body) {
  if (!attestation_) {
    BOOST_LOG_SEV(lg, trivial::trace) << "no attestation provider configured";
    return;
  }

  std::lock_guard lock(attestation_mutex_);
  std::optional<std::string> key_id;
  try {
    key_id = attestation_->get_key_id();
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "attestation key lookup failed: " << e.what();
    return;
  }
  if (!key_id) {
    BOOST_LOG_SEV(lg, trivial::trace)
        << "no attestation key yet, sending without assertion";
    return;
  }

  auto [counter, counter_err] = replay_counter_.increment_counter();
  if (counter_err) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "replay counter increment failed: " << *counter_err;
    return;
  }

  std::string assertion;
  try {
    assertion = attestation_->generate_assertion(body, counter);
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "assertion generation failed: " << e.what();
    return;
  }

  req.set("X-Attest-Key-Id", *key_id);
  req.set("X-Attest-Assertion", assertion);
  req.set("X-Attest-Counter", std::to_string(counter));
}

ApiResponse<json::value>
HttpOrchestrator::send_once(http::verb method, const std::string &path,
                            const std::optional<json::value> &body) {
  std::optional<std::string> payload;
  if (body) {
    payload = serialize_body(*body);
  }
  const HttpRequest req = build_request(method, path, payload);
  HttpResponse resp = transport_->execute(req, timeout());

  const int status = resp.result_int();
  if (!is_success(status)) {
    Error err = classify_http_error(status, resp.base(), resp.body());
    BOOST_LOG_SEV(lg, trivial::debug)
        << req.method_string() << " " << path << " failed: " << err;
    throw ApiException(std::move(err));
  }

  ApiResponse<json::value> out{json::value(nullptr),
                               parse_billing_info(resp.base())};
  if (!resp.body().empty()) {
    boost::system::error_code ec;
    out.data = json::parse(resp.body(), ec);
    if (ec) {
      throw ApiException(make_error(
          ErrorKind::DecodingFailed,
          fmt::format("response of {} is not JSON: {}", path, ec.message())));
    }
  }
  return out;
}

template <typename F> auto HttpOrchestrator::with_registration_retry(F &&attempt) {
  try {
    return attempt();
  } catch (const ApiException &e) {
    if (e.kind() == ErrorKind::InvalidAttestation) {
      reset_attestation();
      throw;
    }
    if (e.kind() != ErrorKind::DeviceNotRegistered) {
      throw;
    }
    if (!registrar_) {
      throw ApiException(make_error(
          ErrorKind::AttestationUnsupported,
          "server requires device registration but attestation is disabled"));
    }
  }

  // DeviceNotRegistered: register, then exactly one more attempt.
  try {
    registrar_->register_device("server reported device_not_registered");
  } catch (const ApiException &e) {
    if (e.kind() == ErrorKind::InvalidAttestation) {
      reset_attestation();
    }
    throw;
  }

  try {
    return attempt();
  } catch (const ApiException &e) {
    if (e.kind() == ErrorKind::InvalidAttestation) {
      reset_attestation();
    }
    throw;
  }
}

ApiResponse<json::value> HttpOrchestrator::send(http::verb method,
                                                const std::string &path,
                                                std::optional<json::value> body) {
  return with_registration_retry(
      [&] { return send_once(method, path, body); });
}

std::future<ApiResponse<json::value>>
HttpOrchestrator::async_send(http::verb method, std::string path,
                             std::optional<json::value> body) {
  auto task = std::make_shared<std::packaged_task<ApiResponse<json::value>()>>(
      [this, method, path = std::move(path), body = std::move(body)] {
        return send(method, path, body);
      });
  auto fut = task->get_future();
  boost::asio::post(pool_, [task] { (*task)(); });
  return fut;
}

std::shared_ptr<ChunkStream>
HttpOrchestrator::open_stream_once(http::verb method, const std::string &path,
                                   const json::value &body) {
  HttpRequest req = build_request(method, path, serialize_body(body));
  req.set(http::field::accept, "text/event-stream");

  std::shared_ptr<IResponseStream> response =
      transport_->open_stream(req, timeout(), timeout() * 2);
  const int status = response->status();
  if (!is_success(status)) {
    const std::string error_body = response->read_all();
    response->close();
    Error err = classify_http_error(status, response->headers(), error_body);
    BOOST_LOG_SEV(lg, trivial::debug)
        << "stream " << path << " failed: " << err;
    throw ApiException(std::move(err));
  }
  return std::make_shared<ChunkStream>(
      std::move(response), config_provider_.get().stream_buffer_chunks);
}

std::shared_ptr<ChunkStream>
HttpOrchestrator::send_streaming(http::verb method, const std::string &path,
                                 const json::value &body) {
  return with_registration_retry(
      [&] { return open_stream_once(method, path, body); });
}

void HttpOrchestrator::register_device() {
  if (!registrar_) {
    throw_error(ErrorKind::AttestationUnsupported,
                "attestation is disabled (attestation_mode=none)");
  }
  try {
    registrar_->register_device("requested");
  } catch (const ApiException &e) {
    if (e.kind() == ErrorKind::InvalidAttestation) {
      reset_attestation();
    }
    throw;
  }
}

RegistrationState HttpOrchestrator::registration_state() const {
  return registrar_ ? registrar_->state() : RegistrationState::Unregistered;
}

std::optional<std::string> HttpOrchestrator::registered_device_id() const {
  return registrar_ ? registrar_->device_id() : std::nullopt;
}

void HttpOrchestrator::reset_attestation() {
  std::lock_guard lock(attestation_mutex_);
  if (attestation_) {
    attestation_->clear_attestation();
  }
  if (auto err = replay_counter_.clear_counter()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "failed to clear replay counter: " << *err;
  }
  BOOST_LOG_SEV(lg, trivial::info) << "local attestation state cleared";
}

} // namespace aigate
