#pragma once

#include <memory>
#include <string>

#include "aigate_common.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"

namespace aigate {

// Lifetime: created through DI inside App::start and kept for the CLI
// session. Handlers are created per dispatch by the injected factory.
class HandlerDispatcher {
  customio::ConsoleOutput &output_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::ConsoleOutput &out, //
                    IHandlerFactory &handler_factory)
      : output_(out), handler_factory_(handler_factory) {}

  // Returns false when no handler exists for subcmd. Errors raised by the
  // handler propagate.
  bool dispatch_run(const std::string &subcmd) {
    if (!is_known_subcommand(subcmd)) {
      return false;
    }
    auto handler = handler_factory_.create(subcmd);
    output_.debug() << "dispatching " << handler->command() << std::endl;
    handler->start();
    return true;
  }
};

} // namespace aigate
