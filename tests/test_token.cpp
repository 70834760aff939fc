#include "test_framework.hpp"

#include "pairgate/security/crypto.hpp"
#include "pairgate/security/token.hpp"

#include <set>
#include <string>

namespace {

std::string replace_last_char(std::string token) {
  token.back() = token.back() == 'A' ? 'B' : 'A';
  return token;
}

std::string segment(const std::string &token, const std::size_t index) {
  std::size_t start = 0;
  for (std::size_t i = 0; i < index; ++i) {
    start = token.find('.', start) + 1;
  }
  const auto end = token.find('.', start);
  return token.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace

void register_token_tests(std::vector<pairgate::tests::TestCase> &tests) {
  using pairgate::tests::require;
  namespace sec = pairgate::security;

  tests.push_back({"token_issue_then_verify_yields_claims", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret", 3600, 1000);
                     const auto result = sec::TokenCodec::verify(token, "secret", 1500);
                     require(result.valid(), "fresh token should verify");
                     require(result.claims.has_value(), "claims should be present");
                     require(result.claims->device_id == "dev-1", "device id round trip");
                     require(result.claims->issued_at == 1000, "iat should be the issue time");
                     require(result.claims->expires_at == 4600, "exp should be iat + ttl");
                   }});

  tests.push_back({"token_has_three_base64url_segments", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret", 60);
                     std::size_t dots = 0;
                     for (const char ch : token) {
                       if (ch == '.') {
                         ++dots;
                       }
                       require(ch != '=' && ch != '+' && ch != '/',
                               "token must be unpadded base64url");
                     }
                     require(dots == 2, "token should have three segments");
                     const auto header = sec::base64url_decode(segment(token, 0));
                     require(header.ok(), "header should decode");
                     require(header.value().find("HS256") != std::string::npos,
                             "header should name HS256");
                   }});

  tests.push_back({"token_expiry_boundary", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret", 10, 1000);
                     require(sec::TokenCodec::verify(token, "secret", 1010).valid(),
                             "token is still valid at exactly exp");
                     const auto expired = sec::TokenCodec::verify(token, "secret", 1011);
                     require(expired.status == sec::TokenStatus::Expired,
                             "token should be expired after exp");
                     require(expired.claims.has_value() && expired.claims->device_id == "dev-1",
                             "expired tokens still report their subject");
                   }});

  tests.push_back({"token_zero_ttl_expires_after_issue", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret", 0, 1000);
                     require(sec::TokenCodec::verify(token, "secret", 1001).status ==
                                 sec::TokenStatus::Expired,
                             "zero ttl is dead one second later");
                   }});

  tests.push_back({"token_wrong_secret_is_bad_signature", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret-a", 60, 1000);
                     const auto result = sec::TokenCodec::verify(token, "secret-b", 1000);
                     require(result.status == sec::TokenStatus::BadSignature,
                             "other secret must not verify");
                     require(!result.claims.has_value(), "no claims without a valid signature");
                   }});

  tests.push_back({"token_tampered_signature_is_rejected", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret", 60, 1000);
                     const auto result =
                         sec::TokenCodec::verify(replace_last_char(token), "secret", 1000);
                     require(result.status == sec::TokenStatus::BadSignature,
                             "altered signature must be rejected");
                   }});

  tests.push_back({"token_tampered_payload_is_rejected", [] {
                     const auto token = sec::TokenCodec::issue("dev-1", "secret", 60, 1000);
                     const std::string forged_payload = sec::base64url_encode(
                         R"({"deviceId":"dev-2","iat":1000,"exp":999999})");
                     const std::string forged =
                         segment(token, 0) + "." + forged_payload + "." + segment(token, 2);
                     const auto result = sec::TokenCodec::verify(forged, "secret", 1000);
                     require(result.status == sec::TokenStatus::BadSignature,
                             "swapped payload must be rejected");
                   }});

  tests.push_back({"token_malformed_inputs", [] {
                     for (const std::string bad :
                          {"", "abc", "a.b", "a.b.c.d", "..", "!!!.???.***", "a..c"}) {
                       const auto result = sec::TokenCodec::verify(bad, "secret", 1000);
                       require(result.status == sec::TokenStatus::Malformed,
                               "should be malformed: '" + bad + "'");
                     }
                   }});

  tests.push_back({"token_rejects_unsigned_algorithm", [] {
                     const std::string header = sec::base64url_encode(R"({"alg":"none"})");
                     const std::string payload =
                         sec::base64url_encode(R"({"deviceId":"dev-1","iat":1,"exp":99999})");
                     const std::string input = header + "." + payload;
                     const std::string mac =
                         sec::base64url_encode(sec::hmac_sha256("secret", input));
                     const auto result =
                         sec::TokenCodec::verify(input + "." + mac, "secret", 10);
                     require(result.status == sec::TokenStatus::Malformed,
                             "alg other than HS256 must be refused");
                   }});

  tests.push_back({"token_payload_without_claims_is_malformed", [] {
                     const std::string header =
                         sec::base64url_encode(R"({"alg":"HS256","typ":"JWT"})");
                     const std::string payload = sec::base64url_encode(R"({"iat":1})");
                     const std::string input = header + "." + payload;
                     const std::string mac =
                         sec::base64url_encode(sec::hmac_sha256("secret", input));
                     const auto result = sec::TokenCodec::verify(input + "." + mac, "secret", 10);
                     require(result.status == sec::TokenStatus::Malformed,
                             "missing deviceId/exp should be malformed");
                   }});

  tests.push_back({"crypto_random_ids_are_unique_uuid_v4", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 200; ++i) {
                       const auto id = sec::random_id();
                       require(id.size() == 36, "uuid layout is 36 chars");
                       require(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-',
                               "uuid dashes");
                       require(id[14] == '4', "version nibble should be 4");
                       seen.insert(id);
                     }
                     require(seen.size() == 200, "ids should not repeat");
                     require(sec::random_hex(32).size() == 64, "hex length is twice the bytes");
                   }});

  tests.push_back({"crypto_base64url_decode_rejects_garbage", [] {
                     require(!sec::base64url_decode("ab+c").ok(), "'+' is not base64url");
                     require(!sec::base64url_decode("abcde").ok(), "length 5 is impossible");
                     const auto decoded = sec::base64url_decode(sec::base64url_encode("hello?"));
                     require(decoded.ok() && decoded.value() == "hello?", "decode of encode");
                   }});

  tests.push_back({"crypto_constant_time_equals", [] {
                     require(sec::constant_time_equals("abc", "abc"), "equal strings");
                     require(!sec::constant_time_equals("abc", "abd"), "different strings");
                     require(!sec::constant_time_equals("abc", "abcd"), "different lengths");
                   }});
}
