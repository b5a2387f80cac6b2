// Numeric codes carried in Error::code, one per ErrorKind.
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int UNKNOWN = 5099;  // Unknown error
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int STREAM_INTERRUPTED = 5206;  // Stream interrupted mid-response
}  // namespace NETWORK

namespace JSON {  // Json errors

constexpr int DECODE_ERROR = 9001;  // Failed to decode/parse JSON (low-level)
constexpr int ENCODE_ERROR = 9002;  // Failed to encode/serialize JSON
}  // namespace JSON

namespace AUTH {  // Credential, identity and replay protection errors

constexpr int INVALID_CREDENTIAL = 6100;  // API key missing or rejected
constexpr int INVALID_APP_IDENTITY = 6101;  // Bundle id rejected
constexpr int INVALID_TEAM_IDENTITY = 6102;  // Team id rejected
constexpr int TIMESTAMP_EXPIRED = 6110;  // Request timestamp outside window
constexpr int NONCE_REUSED = 6111;  // Nonce already seen by server
constexpr int INVALID_SIGNATURE = 6112;  // Signature mismatch or missing
}  // namespace AUTH

namespace ATTESTATION {  // Device attestation errors

constexpr int REQUIRED = 6200;  // Server demands attestation
constexpr int DEVICE_NOT_REGISTERED = 6201;  // Device key unknown to server
constexpr int INVALID = 6202;  // Attestation rejected
constexpr int REVOKED = 6203;  // Attestation revoked
constexpr int UNSUPPORTED = 6204;  // Attestation unavailable on this device
constexpr int FAILED = 6205;  // Local attestation or key generation failed
constexpr int KEY_MISSING = 6206;  // Assertion requested without a key
constexpr int SIMULATOR_NOT_ALLOWED = 6207;  // Simulator attestation refused
}  // namespace ATTESTATION

namespace QUOTA {  // Quota and throughput errors

constexpr int RATE_LIMITED = 6300;  // Rate limit exceeded
constexpr int QUOTA_EXCEEDED = 6301;  // Quota exceeded
constexpr int INSUFFICIENT_BALANCE = 6302;  // Not enough credits
}  // namespace QUOTA

namespace HTTP {  // Generic HTTP errors

constexpr int MALFORMED_REQUEST = 6400;  // Server reported 400
constexpr int SERVER_ERROR = 6401;  // Server reported 5xx
constexpr int UNEXPECTED_STATUS = 6402;  // Other non-success status
}  // namespace HTTP

}  // namespace my_errors
