#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pairgate::security {

struct TokenClaims {
  std::string device_id;
  std::int64_t issued_at = 0;  // unix seconds
  std::int64_t expires_at = 0; // unix seconds
};

enum class TokenStatus { Valid, Expired, BadSignature, Malformed };

struct TokenVerification {
  TokenStatus status = TokenStatus::Malformed;
  // Present whenever the signature holds, including for expired tokens.
  std::optional<TokenClaims> claims;

  [[nodiscard]] bool valid() const { return status == TokenStatus::Valid; }
};

[[nodiscard]] std::string_view token_status_name(TokenStatus status);

/// Compact HS256 session tokens: base64url(header).base64url(payload).base64url(mac).
class TokenCodec {
public:
  [[nodiscard]] static std::string issue(const std::string &device_id, const std::string &secret,
                                         std::int64_t ttl_seconds);
  [[nodiscard]] static std::string issue(const std::string &device_id, const std::string &secret,
                                         std::int64_t ttl_seconds, std::int64_t now_seconds);

  [[nodiscard]] static TokenVerification verify(const std::string &token,
                                                const std::string &secret);
  [[nodiscard]] static TokenVerification verify(const std::string &token,
                                                const std::string &secret,
                                                std::int64_t now_seconds);
};

} // namespace pairgate::security
