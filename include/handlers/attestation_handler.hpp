#pragma once

#include <string>

#include "aigate_common.hpp"
#include "api/aigate_client.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "state/attestation_state_store.hpp"

namespace aigate {

// aigate attestation status|register|reset
class AttestationHandler : public IHandler {
  AigateClient &client_;
  SqliteAttestationStateStore &state_store_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

  void show_status();

public:
  AttestationHandler(AigateClient &client,
                     SqliteAttestationStateStore &state_store,
                     customio::ConsoleOutput &output_hub, CliCtx &cli_ctx)
      : client_(client), state_store_(state_store), output_hub_(output_hub),
        cli_ctx_(cli_ctx) {}

  std::string command() const override { return "attestation"; }

  void start() override;
};

} // namespace aigate
