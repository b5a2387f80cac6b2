#include "transport/endpoint.hpp"

#include <boost/url.hpp>
#include <fmt/format.h>

#include <stdexcept>

namespace aigate {
namespace urls = boost::urls;

std::string Endpoint::host_header() const {
  const bool default_port =
      (tls && port == "443") || (!tls && port == "80");
  return default_port ? host : host + ":" + port;
}

std::string Endpoint::target_for(std::string_view path) const {
  std::string target = base_path;
  if (path.empty() || path.front() != '/') {
    target += '/';
  }
  target += path;
  return target;
}

Endpoint parse_endpoint(const std::string &base_url) {
  auto parsed = urls::parse_uri(base_url);
  if (!parsed) {
    throw std::runtime_error(fmt::format("invalid base url '{}': {}", base_url,
                                         parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    throw std::runtime_error(
        fmt::format("base url missing host: '{}'", base_url));
  }

  Endpoint ep;
  ep.scheme = std::string(url.scheme());
  if (ep.scheme == "https") {
    ep.tls = true;
  } else if (ep.scheme == "http") {
    ep.tls = false;
  } else {
    throw std::runtime_error(fmt::format(
        "base url must use http:// or https:// (got '{}')", ep.scheme));
  }
  ep.host = std::string(url.host());
  ep.port = url.has_port() ? std::string(url.port())
                           : std::string(ep.tls ? "443" : "80");
  std::string path = std::string(url.encoded_path());
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  ep.base_path = path;
  return ep;
}

} // namespace aigate
