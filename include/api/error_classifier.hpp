#pragma once

#include <boost/beast/http/fields.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "api/api_error.hpp"

namespace aigate {

// {"error": {"message": ..., "type": ..., "code": ...}}, all members optional.
struct ApiErrorBody {
  std::string message;
  std::optional<std::string> type;
  std::optional<std::string> code;
};

std::optional<ApiErrorBody> parse_api_error_body(std::string_view body);

// Whole-string non-negative decimal seconds; anything else is std::nullopt.
std::optional<std::int64_t> parse_retry_after(std::string_view value);

// Exact server error codes; std::nullopt for codes this client does not know.
std::optional<ErrorKind> kind_for_server_code(std::string_view code);

// Maps a non-2xx response onto the taxonomy. A recognised error code in the
// body wins, otherwise the status decides: 401 invalid credential, 429 rate
// limited, 400 malformed request, 5xx server error, anything else HttpStatus.
Error classify_http_error(int status, const boost::beast::http::fields &headers,
                          std::string_view body);

} // namespace aigate
