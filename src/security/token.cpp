#include "pairgate/security/token.hpp"

#include "pairgate/common/json_util.hpp"
#include "pairgate/common/time.hpp"
#include "pairgate/security/crypto.hpp"

#include <vector>

namespace pairgate::security {

namespace {

constexpr const char *HEADER_JSON = R"({"alg":"HS256","typ":"JWT"})";

std::vector<std::string> split_segments(const std::string &token) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto dot = token.find('.', start);
    if (dot == std::string::npos) {
      parts.push_back(token.substr(start));
      break;
    }
    parts.push_back(token.substr(start, dot - start));
    start = dot + 1;
  }
  return parts;
}

std::string sign(const std::string &signing_input, const std::string &secret) {
  return base64url_encode(hmac_sha256(secret, signing_input));
}

std::optional<TokenClaims> parse_claims(const std::string &payload) {
  if (!common::json_is_object(payload)) {
    return std::nullopt;
  }
  const auto fields = common::json_parse_flat(payload);
  const auto device = fields.find("deviceId");
  const auto iat = fields.find("iat");
  const auto exp = fields.find("exp");
  if (device == fields.end() || iat == fields.end() || exp == fields.end() ||
      device->second.empty()) {
    return std::nullopt;
  }
  const auto issued = common::json_to_int64(iat->second);
  const auto expires = common::json_to_int64(exp->second);
  if (!issued.has_value() || !expires.has_value()) {
    return std::nullopt;
  }
  return TokenClaims{.device_id = device->second, .issued_at = *issued, .expires_at = *expires};
}

} // namespace

std::string_view token_status_name(const TokenStatus status) {
  switch (status) {
  case TokenStatus::Valid:
    return "valid";
  case TokenStatus::Expired:
    return "expired";
  case TokenStatus::BadSignature:
    return "bad_signature";
  case TokenStatus::Malformed:
    return "malformed";
  }
  return "malformed";
}

std::string TokenCodec::issue(const std::string &device_id, const std::string &secret,
                              const std::int64_t ttl_seconds) {
  return issue(device_id, secret, ttl_seconds, common::now_unix_seconds());
}

std::string TokenCodec::issue(const std::string &device_id, const std::string &secret,
                              const std::int64_t ttl_seconds, const std::int64_t now_seconds) {
  const std::string payload = "{\"deviceId\":" + common::json_string(device_id) +
                              ",\"iat\":" + std::to_string(now_seconds) +
                              ",\"exp\":" + std::to_string(now_seconds + ttl_seconds) + "}";
  const std::string signing_input =
      base64url_encode(HEADER_JSON) + "." + base64url_encode(payload);
  return signing_input + "." + sign(signing_input, secret);
}

TokenVerification TokenCodec::verify(const std::string &token, const std::string &secret) {
  return verify(token, secret, common::now_unix_seconds());
}

TokenVerification TokenCodec::verify(const std::string &token, const std::string &secret,
                                     const std::int64_t now_seconds) {
  TokenVerification result;
  const auto parts = split_segments(token);
  if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
    return result;
  }

  const auto header = base64url_decode(parts[0]);
  const auto payload = base64url_decode(parts[1]);
  const auto signature = base64url_decode(parts[2]);
  if (!header.ok() || !payload.ok() || !signature.ok()) {
    return result;
  }
  if (common::json_get_string(header.value(), "alg") != "HS256") {
    return result;
  }

  // Compare the encoded form so every character of the segment is significant.
  const std::string expected = sign(parts[0] + "." + parts[1], secret);
  if (!constant_time_equals(expected, parts[2])) {
    result.status = TokenStatus::BadSignature;
    return result;
  }

  auto claims = parse_claims(payload.value());
  if (!claims.has_value()) {
    return result;
  }
  result.status = claims->expires_at < now_seconds ? TokenStatus::Expired : TokenStatus::Valid;
  result.claims = std::move(claims);
  return result;
}

} // namespace pairgate::security
