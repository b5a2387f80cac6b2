#pragma once

#include <boost/beast/http/fields.hpp>

#include <cstdint>
#include <optional>

namespace aigate {

// X-Credits-Used / X-Credits-Remaining / X-Credits-Overage
struct BillingInfo {
  std::int64_t credits_used_cents{0};
  std::int64_t credits_remaining_cents{0};
  bool is_overage{false};
};

// All three headers must be present and the amounts must be integers.
std::optional<BillingInfo>
parse_billing_info(const boost::beast::http::fields &headers);

template <typename T> struct ApiResponse {
  T data;
  std::optional<BillingInfo> billing;
};

} // namespace aigate
