#pragma once

#include <memory>

#include "api/http_orchestrator.hpp"
#include "attestation/attestation_provider.hpp"
#include "conf/aigate_config.hpp"
#include "state/attestation_state_store.hpp"
#include "transport/http_transport.hpp"

namespace aigate {

// Production object graph for one configuration: Beast transport on the
// resolved base url, the attestation provider chosen by attestation_mode and
// an orchestrator over both. Built once, shared by the CLI handlers.
class AigateClient {
public:
  AigateClient(IAigateConfigProvider &config_provider,
               SqliteAttestationStateStore &state_store);

  HttpOrchestrator &orchestrator() { return *orchestrator_; }
  IAttestationProvider *attestation_provider() const {
    return attestation_.get();
  }
  const Endpoint &endpoint() const { return transport_->endpoint(); }

private:
  std::shared_ptr<BeastHttpTransport> transport_;
  std::shared_ptr<IAttestationProvider> attestation_;
  std::unique_ptr<HttpOrchestrator> orchestrator_;
};

} // namespace aigate
