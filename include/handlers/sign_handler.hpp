#pragma once

#include <string>

#include "aigate_common.hpp"
#include "conf/aigate_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"

namespace aigate {

// aigate sign [--body JSON]
// Prints the X-Timestamp / X-Nonce / X-Signature headers a request with this
// body would carry.
class SignHandler : public IHandler {
  IAigateConfigProvider &config_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

public:
  SignHandler(IAigateConfigProvider &config_provider,
              customio::ConsoleOutput &output_hub, CliCtx &cli_ctx)
      : config_provider_(config_provider), output_hub_(output_hub),
        cli_ctx_(cli_ctx) {}

  std::string command() const override { return "sign"; }

  void start() override;
};

} // namespace aigate
