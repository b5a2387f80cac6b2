#pragma once

#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "api/api_error.hpp"
#include "api/api_response.hpp"
#include "api/device_registrar.hpp"
#include "api/request_signer.hpp"
#include "attestation/attestation_provider.hpp"
#include "conf/aigate_config.hpp"
#include "state/attestation_state_store.hpp"
#include "stream/chunk_stream.hpp"
#include "transport/http_transport.hpp"
#include "util/device_info.hpp"
#include "util/my_logging.hpp"

namespace aigate {

// Builds signed (and, when a device key exists, attested) requests, classifies
// failures into ErrorKind and, on DeviceNotRegistered, registers the device
// and re-issues the request once.
//
// All methods are safe to call concurrently.
class HttpOrchestrator {
public:
  // attestation may be null, in which case no attestation headers are sent
  // and DeviceNotRegistered surfaces as AttestationUnsupported.
  HttpOrchestrator(IAigateConfigProvider &config_provider,
                   std::shared_ptr<IHttpTransport> transport,
                   std::shared_ptr<IAttestationProvider> attestation,
                   IReplayCounter &replay_counter,
                   device::DeviceInfo device_info);
  ~HttpOrchestrator();

  HttpOrchestrator(const HttpOrchestrator &) = delete;
  HttpOrchestrator &operator=(const HttpOrchestrator &) = delete;

  ApiResponse<json::value> send(http::verb method, const std::string &path,
                                std::optional<json::value> body = std::nullopt);

  std::future<ApiResponse<json::value>>
  async_send(http::verb method, std::string path,
             std::optional<json::value> body = std::nullopt);

  template <typename T>
  ApiResponse<T> send_as(http::verb method, const std::string &path,
                         std::optional<json::value> body = std::nullopt) {
    auto response = send(method, path, std::move(body));
    try {
      return ApiResponse<T>{json::value_to<T>(response.data),
                            response.billing};
    } catch (const std::exception &e) {
      throw ApiException(make_error(ErrorKind::DecodingFailed, e.what()));
    }
  }

  // Returns once the response status is known. A non-2xx status is drained
  // and thrown like send() would, before any chunk is produced.
  std::shared_ptr<ChunkStream> send_streaming(http::verb method,
                                              const std::string &path,
                                              const json::value &body);

  // Registration on demand, without a triggering request.
  void register_device();
  RegistrationState registration_state() const;
  std::optional<std::string> registered_device_id() const;

  // Forgets the local key id and zeroes the replay counter.
  void reset_attestation();

  IAttestationProvider *attestation_provider() const {
    return attestation_.get();
  }

  // The request as it would go on the wire, minus transport-level headers.
  HttpRequest build_request(http::verb method, const std::string &path,
                            const std::optional<std::string> &body);

private:
  ApiResponse<json::value> send_once(http::verb method, const std::string &path,
                                     const std::optional<json::value> &body);
  std::shared_ptr<ChunkStream> open_stream_once(http::verb method,
                                                const std::string &path,
                                                const json::value &body);
  void attach_attestation(HttpRequest &req, const std::string &body);

  template <typename F> auto with_registration_retry(F &&attempt);

  std::optional<std::string> team_id() const;
  std::chrono::seconds timeout() const;

  IAigateConfigProvider &config_provider_;
  std::shared_ptr<IHttpTransport> transport_;
  std::shared_ptr<IAttestationProvider> attestation_;
  IReplayCounter &replay_counter_;
  RequestSigner signer_;
  std::unique_ptr<DeviceRegistrar> registrar_;
  std::string user_agent_;
  std::mutex attestation_mutex_;
  boost::asio::thread_pool pool_;
  Logger lg;
};

} // namespace aigate
