#include "handlers/sign_handler.hpp"

#include "api/request_signer.hpp"
#include "handlers/request_handler.hpp"

namespace aigate {

void SignHandler::start() {
  const auto &cfg = config_provider_.get();
  RequestSigner signer(cfg.api_key, cfg.bundle_id);

  std::optional<std::string> payload;
  if (auto body = parse_cli_body(cli_ctx_)) {
    payload = json::serialize(*body);
  }
  const auto envelope = payload ? signer.sign(std::string_view(*payload))
                                : signer.sign(std::nullopt);

  output_hub_.out() << "X-Timestamp: " << envelope.timestamp << "\n"
                    << "X-Nonce: " << envelope.nonce << "\n"
                    << "X-Signature: " << envelope.signature << std::endl;
  if (payload) {
    output_hub_.debug() << "signed body: " << *payload << std::endl;
  }
}

} // namespace aigate
