#include "api/api_response.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <charconv>
#include <string_view>

namespace aigate {
namespace http = boost::beast::http;

namespace {

std::optional<std::string_view> header_value(const http::fields &headers,
                                             std::string_view name) {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value().data(), it->value().size());
}

std::optional<std::int64_t> parse_int(std::string_view s) {
  std::int64_t out{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return out;
}

} // namespace

std::optional<BillingInfo> parse_billing_info(const http::fields &headers) {
  auto used = header_value(headers, "X-Credits-Used");
  auto remaining = header_value(headers, "X-Credits-Remaining");
  auto overage = header_value(headers, "X-Credits-Overage");
  if (!used || !remaining || !overage) {
    return std::nullopt;
  }
  auto used_cents = parse_int(*used);
  auto remaining_cents = parse_int(*remaining);
  if (!used_cents || !remaining_cents) {
    return std::nullopt;
  }
  BillingInfo info;
  info.credits_used_cents = *used_cents;
  info.credits_remaining_cents = *remaining_cents;
  info.is_overage = *overage == "1" || boost::iequals(*overage, "true");
  return info;
}

} // namespace aigate
