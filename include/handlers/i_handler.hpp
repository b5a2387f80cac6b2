#pragma once

#include <functional>
#include <memory>
#include <string>

namespace aigate {

struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // Throws std::runtime_error for an unknown subcommand.
  virtual std::shared_ptr<class IHandler> create(const std::string &subcmd) = 0;
};

// Common contract for subcommand handlers
struct IHandler {
  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "sign", "post")
  virtual std::string command() const = 0;
  // Runs the subcommand; failures are thrown (ApiException for API errors).
  virtual void start() = 0;
};

struct HandlerFactoryImpl : public IHandlerFactory {
  using CreatorFunc =
      std::function<std::shared_ptr<IHandler>(const std::string &subcmd)>;
  CreatorFunc creator_;

  explicit HandlerFactoryImpl(CreatorFunc creator)
      : creator_(std::move(creator)) {}

  std::shared_ptr<IHandler> create(const std::string &subcmd) override {
    return creator_(subcmd);
  }
};

} // namespace aigate
