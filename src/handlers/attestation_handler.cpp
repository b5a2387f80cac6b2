#include "handlers/attestation_handler.hpp"

#include <stdexcept>

namespace aigate {

void AttestationHandler::show_status() {
  auto *provider = client_.attestation_provider();
  if (!provider) {
    output_hub_.out() << "attestation: disabled" << std::endl;
    return;
  }
  output_hub_.out() << "attestation: " << provider->variant()
                    << (provider->is_supported() ? "" : " (unsupported)")
                    << "\n"
                    << "key id: " << provider->get_key_id().value_or("-")
                    << "\n"
                    << "replay counter: " << state_store_.get_counter()
                    << std::endl;
  if (!state_store_.available()) {
    output_hub_.warning() << "attestation state store is unavailable; check "
                             "runtime_dir"
                          << std::endl;
  }
}

void AttestationHandler::start() {
  const std::string action = cli_ctx_.positional_at(1).value_or("status");
  if (action == "status") {
    show_status();
  } else if (action == "register") {
    client_.orchestrator().register_device();
    auto &orchestrator = client_.orchestrator();
    output_hub_.out() << "device registered, id="
                      << orchestrator.registered_device_id().value_or("-")
                      << ", state="
                      << to_string(orchestrator.registration_state())
                      << std::endl;
  } else if (action == "reset") {
    client_.orchestrator().reset_attestation();
    output_hub_.out() << "local attestation state cleared" << std::endl;
  } else {
    throw std::runtime_error("usage: aigate attestation status|register|reset");
  }
}

} // namespace aigate
