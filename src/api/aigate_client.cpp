#include "api/aigate_client.hpp"

#include "util/device_info.hpp"

namespace aigate {

AigateClient::AigateClient(IAigateConfigProvider &config_provider,
                           SqliteAttestationStateStore &state_store) {
  const auto &cfg = config_provider.get();
  transport_ = std::make_shared<BeastHttpTransport>(
      parse_endpoint(cfg.resolved_base_url()), cfg.verify_tls);
  attestation_ = make_attestation_provider(
      cfg.attestation_mode, state_store,
      std::make_shared<UnavailablePlatformAttestationService>(), cfg.bundle_id);
  orchestrator_ = std::make_unique<HttpOrchestrator>(
      config_provider, transport_, attestation_, state_store,
      device::gather_device_info());
}

} // namespace aigate
