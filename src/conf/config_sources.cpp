#include "conf/config_sources.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace aigate {

namespace {

void merge_file(const fs::path &file, json::object &merged, bool &found) {
  if (!fs::exists(file)) {
    return;
  }
  std::ifstream ifs(file);
  if (!ifs) {
    throw std::runtime_error("Unable to open configuration file: " +
                             file.string());
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  auto jv = json::parse(content, ec);
  if (ec) {
    throw std::runtime_error(fmt::format(
        "Failed to parse configuration file {}: {}", file.string(),
        ec.message()));
  }
  if (!jv.is_object()) {
    throw std::runtime_error("Configuration file is not a JSON object: " +
                             file.string());
  }
  for (const auto &[key, value] : jv.as_object()) {
    merged[key] = value;
  }
  found = true;
}

} // namespace

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles,
                             std::map<std::string, std::string> cli_overrides)
    : paths_(std::move(paths)), profiles_(std::move(profiles)),
      cli_overrides_(std::move(cli_overrides)) {
  application_json = json_content("application");
}

std::optional<json::value>
ConfigSources::json_content(const std::string &name) const {
  json::object merged;
  bool found = false;
  for (const auto &dir : paths_) {
    merge_file(dir / (name + ".json"), merged, found);
    for (const auto &profile : profiles_) {
      merge_file(dir / (name + "." + profile + ".json"), merged, found);
    }
    merge_file(dir / (name + ".override.json"), merged, found);
  }
  if (name == "application") {
    for (const auto &[key, value] : cli_overrides_) {
      merged[key] = value;
      found = true;
    }
  }
  if (!found) {
    return std::nullopt;
  }
  return json::value(std::move(merged));
}

LoggingConfig ConfigSources::logging_config() const {
  auto jv = json_content("log_config");
  if (!jv) {
    return LoggingConfig{};
  }
  return json::value_to<LoggingConfig>(*jv);
}

} // namespace aigate
