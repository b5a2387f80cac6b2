#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>

#include "api/request_signer.hpp"
#include "openssl/crypt_util.hpp"

namespace {

constexpr const char *kApiKey = "sk_test_123";
constexpr const char *kBundleId = "com.example.app";
constexpr std::int64_t kTimestamp = 1700000000;
constexpr const char *kNonce = "550e8400-e29b-41d4-a716-446655440000";
constexpr const char *kChatBody =
    R"({"messages":[{"role":"user","content":"Hello"}]})";

TEST(RequestSignerTest, MatchesKnownVectorForEmptyBody) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  EXPECT_EQ(signer.compute_signature(kTimestamp, kNonce, std::string_view{}),
            "/5QpdUd8UCAt2GYPPk53cEVMs3bi4QQP/8W+wpmD3o4=");
}

TEST(RequestSignerTest, MatchesKnownVectorForChatBody) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  EXPECT_EQ(signer.compute_signature(kTimestamp, kNonce,
                                     std::string_view(kChatBody)),
            "st+6WXbjnr5gvz0xuQvLnmW5LhHjL1i1LKmNnTJSQB0=");
}

TEST(RequestSignerTest, SignatureIsBase64OfThirtyTwoBytes) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  auto sig = signer.compute_signature(kTimestamp, kNonce,
                                      std::string_view(kChatBody));
  EXPECT_EQ(sig.size(), 44u);
  auto raw = aigate::cryptutil::base64_decode(sig);
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(raw->size(), 32u);
}

TEST(RequestSignerTest, AbsentBodySignsLikeEmptyBody) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  EXPECT_EQ(signer.compute_signature(kTimestamp, kNonce, std::nullopt),
            signer.compute_signature(kTimestamp, kNonce, std::string_view{}));
}

TEST(RequestSignerTest, DeterministicForIdenticalInputs) {
  aigate::RequestSigner a(kApiKey, kBundleId);
  aigate::RequestSigner b(kApiKey, kBundleId);
  EXPECT_EQ(a.compute_signature(kTimestamp, kNonce, std::string_view(kChatBody)),
            b.compute_signature(kTimestamp, kNonce, std::string_view(kChatBody)));
}

TEST(RequestSignerTest, EachInputChangesTheSignature) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  const auto base =
      signer.compute_signature(kTimestamp, kNonce, std::string_view(kChatBody));

  EXPECT_NE(base, signer.compute_signature(kTimestamp + 1, kNonce,
                                           std::string_view(kChatBody)));
  EXPECT_NE(base, signer.compute_signature(
                      kTimestamp, "550e8400-e29b-41d4-a716-446655440001",
                      std::string_view(kChatBody)));
  EXPECT_NE(base, signer.compute_signature(kTimestamp, kNonce,
                                           std::string_view("{}")));

  aigate::RequestSigner other_key("sk_test_124", kBundleId);
  EXPECT_NE(base, other_key.compute_signature(kTimestamp, kNonce,
                                              std::string_view(kChatBody)));
  aigate::RequestSigner other_app(kApiKey, "com.example.other");
  EXPECT_NE(base, other_app.compute_signature(kTimestamp, kNonce,
                                              std::string_view(kChatBody)));
}

TEST(RequestSignerTest, AppIdentityIsCaseInsensitive) {
  aigate::RequestSigner lower(kApiKey, "com.example.app");
  aigate::RequestSigner mixed(kApiKey, "COM.Example.App");
  EXPECT_EQ(
      lower.compute_signature(kTimestamp, kNonce, std::string_view(kChatBody)),
      mixed.compute_signature(kTimestamp, kNonce, std::string_view(kChatBody)));
}

TEST(RequestSignerTest, SignProducesFreshUuidNonces) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  const std::regex uuid_v4(
      "^[0-9A-F]{8}-[0-9A-F]{4}-4[0-9A-F]{3}-[89AB][0-9A-F]{3}-[0-9A-F]{12}$");
  std::set<std::string> nonces;
  for (int i = 0; i < 200; ++i) {
    auto env = signer.sign(std::string_view(kChatBody));
    EXPECT_TRUE(std::regex_match(env.nonce, uuid_v4)) << env.nonce;
    nonces.insert(env.nonce);
  }
  EXPECT_EQ(nonces.size(), 200u);
}

TEST(RequestSignerTest, SignIsVerifiableWithComputeSignature) {
  aigate::RequestSigner signer(kApiKey, kBundleId);
  auto env = signer.sign(std::string_view(kChatBody));
  EXPECT_GT(env.timestamp, kTimestamp);
  EXPECT_EQ(env.signature,
            signer.compute_signature(env.timestamp, env.nonce,
                                     std::string_view(kChatBody)));
}

TEST(CryptUtilTest, Sha256HexOfEmptyInput) {
  EXPECT_EQ(aigate::cryptutil::sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptUtilTest, Base64EncodesAndRejectsGarbage) {
  EXPECT_EQ(aigate::cryptutil::base64_encode("challenge-bytes"),
            "Y2hhbGxlbmdlLWJ5dGVz");
  EXPECT_EQ(aigate::cryptutil::base64_decode("Y2hhbGxlbmdlLWJ5dGVz").value(),
            "challenge-bytes");
  EXPECT_FALSE(aigate::cryptutil::base64_decode("not base64!").has_value());
}

TEST(CryptUtilTest, BigEndianCounterBytes) {
  EXPECT_EQ(aigate::cryptutil::big_endian_bytes(1),
            std::string("\x00\x00\x00\x00\x00\x00\x00\x01", 8));
  EXPECT_EQ(aigate::cryptutil::big_endian_bytes(0x0102030405060708),
            std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
}

} // namespace
