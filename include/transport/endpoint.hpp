#pragma once

#include <string>
#include <string_view>

namespace aigate {

struct Endpoint {
  std::string scheme;
  std::string host;
  std::string port;
  std::string base_path; // no trailing '/'
  bool tls{true};

  // host[:port] when the port is not the scheme default.
  std::string host_header() const;
  // base_path + path, path gets a leading '/' if it lacks one.
  std::string target_for(std::string_view path) const;
};

// Accepts http:// and https:// URLs. Throws std::runtime_error otherwise.
Endpoint parse_endpoint(const std::string &base_url);

} // namespace aigate
