#pragma once

#include <boost/json.hpp>

#include <optional>
#include <string>

#include "aigate_common.hpp"
#include "api/aigate_client.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "util/my_logging.hpp"

namespace aigate {

// --body as JSON; throws ApiException(EncodingFailed) when it does not parse.
std::optional<boost::json::value> parse_cli_body(const CliCtx &cli_ctx);

// aigate post <path> [--body JSON]
// aigate stream <path> --body JSON
class RequestHandler : public IHandler {
  AigateClient &client_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  Logger lg;

  void run_post(const std::string &path);
  void run_stream(const std::string &path);

public:
  RequestHandler(AigateClient &client, customio::ConsoleOutput &output_hub,
                 CliCtx &cli_ctx)
      : client_(client), output_hub_(output_hub), cli_ctx_(cli_ctx) {}

  std::string command() const override { return cli_ctx_.params.subcmd; }

  void start() override;
};

} // namespace aigate
