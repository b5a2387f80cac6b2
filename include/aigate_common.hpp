#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace aigate {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  fs::path runtime_dir;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;
  std::optional<std::string> body;
  std::optional<std::string> url_base_override;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  aigate::CliParams params;
  CliCtx(po::variables_map &&vm,                 //
         std::vector<std::string> &&positionals, //
         aigate::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        params(std::move(params_)) {}

  // True iff the option was given explicitly rather than taken from a default.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  // positionals[0] is the subcommand; index 1 is its first argument.
  std::optional<std::string> positional_at(std::size_t index) const {
    if (index < positionals.size()) {
      return positionals[index];
    }
    return std::nullopt;
  }

  std::size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 4> kKnown{
      "sign", "post", "stream", "attestation"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

} // namespace aigate
