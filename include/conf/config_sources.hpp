#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace aigate {

namespace fs = std::filesystem;
namespace json = boost::json;

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"logs"};
  std::string log_file{"aigate"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    LoggingConfig lc{};
    if (auto *p = jo_p->if_contains("level"))
      lc.level = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("log_dir"))
      lc.log_dir = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("log_file"))
      lc.log_file = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("rotation_size"))
      lc.rotation_size = p->to_number<std::uint64_t>();
    return lc;
  }
};

// Ordered set of configuration directories. For a config name such as
// "application" every directory contributes name.json, then
// name.<profile>.json for each profile, then name.override.json; keys found
// later replace earlier ones at the top level.
class ConfigSources {
public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles,
                std::map<std::string, std::string> cli_overrides = {});

  // Merged content, or std::nullopt when no file for the name exists.
  // Throws std::runtime_error when a file is unreadable or not a JSON object.
  std::optional<json::value> json_content(const std::string &name) const;

  LoggingConfig logging_config() const;

  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;
  std::optional<json::value> application_json;

private:
  std::map<std::string, std::string> cli_overrides_;
};

} // namespace aigate
