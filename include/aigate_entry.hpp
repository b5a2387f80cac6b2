#pragma once

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

#include "aigate_common.hpp"
#include "api/aigate_client.hpp"
#include "api/api_error.hpp"
#include "boost/di.hpp"
#include "conf/aigate_config.hpp"
#include "conf/config_sources.hpp"
#include "customio/console_output.hpp"
#include "handlers/attestation_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/request_handler.hpp"
#include "handlers/sign_handler.hpp"
#include "state/attestation_state_store.hpp"

namespace di = boost::di;
namespace aigate {

class App {
  aigate::CliCtx &cli_ctx_;
  aigate::ConfigSources &config_sources_;
  customio::ConsoleOutput output_hub_;

public:
  App(aigate::ConfigSources &config_sources, aigate::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources),
        output_hub_(cli_ctx.verbosity_level()) {}

  void print_error(const Error &err) { output_hub_.error() << err << std::endl; }

  // Process exit status.
  int start() {
    auto handler_module = []() {
      return di::make_injector(
          di::bind<aigate::SignHandler>().in(di::unique),
          di::bind<aigate::RequestHandler>().in(di::unique),
          di::bind<aigate::AttestationHandler>().in(di::unique),
          di::bind<aigate::IHandlerFactory>().to(
              [](const auto &inj) -> aigate::IHandlerFactory & {
                static aigate::HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<aigate::IHandler> {
                      if (subcmd == "sign") {
                        return inj.template create<
                            std::shared_ptr<aigate::SignHandler>>();
                      } else if (subcmd == "post" || subcmd == "stream") {
                        return inj.template create<
                            std::shared_ptr<aigate::RequestHandler>>();
                      } else if (subcmd == "attestation") {
                        return inj.template create<
                            std::shared_ptr<aigate::AttestationHandler>>();
                      } else {
                        throw std::runtime_error("Unsupported subcommand: " +
                                                 subcmd);
                      }
                    });
                return factory;
              }));
    };

    auto injector = di::make_injector(
        handler_module(),
        di::bind<aigate::ConfigSources>().to(config_sources_),
        di::bind<aigate::IAigateConfigProvider>()
            .to<aigate::AigateConfigProviderFile>(),
        di::bind<customio::ConsoleOutput>().to(output_hub_),
        di::bind<aigate::CliCtx>().to(cli_ctx_));

    output_hub_.debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths_) {
      output_hub_.debug() << " - " << source.string() << std::endl;
    }

    try {
      auto &dispatcher =
          injector.template create<aigate::HandlerDispatcher &>();
      if (!dispatcher.dispatch_run(cli_ctx_.params.subcmd)) {
        output_hub_.error()
            << "No valid subcommand provided. Available: sign, post, stream, "
               "attestation."
            << std::endl;
        return EXIT_FAILURE;
      }
    } catch (const ApiException &e) {
      print_error(e.error());
      return EXIT_FAILURE;
    } catch (const std::exception &e) {
      print_error(make_error(ErrorKind::Unknown, e.what()));
      return EXIT_FAILURE;
    }
    output_hub_.debug() << "Handler completed successfully." << std::endl;
    return EXIT_SUCCESS;
  }
};

inline int launch(aigate::ConfigSources &config, aigate::CliCtx &ctx) {
  App app(config, ctx);
  return app.start();
}

} // namespace aigate
