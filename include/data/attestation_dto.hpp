#pragma once

#include <boost/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace aigate::data {
namespace json = boost::json;

// POST /v1/attestation/challenge {"bundleId": "..."}
// => 200 {"challenge": "<base64>"}
struct AttestationChallengeRequest {
  std::string bundle_id;

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const AttestationChallengeRequest &r) {
    jv = json::object{{"bundleId", r.bundle_id}};
  }
};

struct AttestationChallengeResponse {
  std::string challenge;

  friend AttestationChallengeResponse
  tag_invoke(const json::value_to_tag<AttestationChallengeResponse> &,
             const json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("AttestationChallengeResponse is not an object");
    }
    AttestationChallengeResponse r;
    r.challenge = json::value_to<std::string>(jo_p->at("challenge"));
    return r;
  }
};

// POST /v1/attestation/register
// {"keyId","attestationObject","bundleId","teamId","deviceModel","osVersion"}
// => 200 {"success": true, "deviceId": "..."}
struct AttestationRegisterRequest {
  std::string key_id;
  std::string attestation_object;
  std::string bundle_id;
  std::optional<std::string> team_id;
  std::string device_model;
  std::string os_version;

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const AttestationRegisterRequest &r) {
    json::object jo{{"keyId", r.key_id},
                    {"attestationObject", r.attestation_object},
                    {"bundleId", r.bundle_id},
                    {"deviceModel", r.device_model},
                    {"osVersion", r.os_version}};
    if (r.team_id) {
      jo["teamId"] = *r.team_id;
    }
    jv = std::move(jo);
  }
};

struct AttestationRegisterResponse {
  bool success{false};
  std::optional<std::string> device_id;

  friend AttestationRegisterResponse
  tag_invoke(const json::value_to_tag<AttestationRegisterResponse> &,
             const json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("AttestationRegisterResponse is not an object");
    }
    AttestationRegisterResponse r;
    r.success = jo_p->at("success").as_bool();
    if (auto *d = jo_p->if_contains("deviceId"); d && d->is_string()) {
      r.device_id = json::value_to<std::string>(*d);
    }
    return r;
  }
};

} // namespace aigate::data
