#pragma once

#include "pairgate/common/result.hpp"

#include <cstddef>
#include <string>

namespace pairgate::security {

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Random identifier in the 8-4-4-4-12 UUID (v4) layout.
[[nodiscard]] std::string random_id();

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Raw 32-byte HMAC-SHA256 digest.
[[nodiscard]] std::string hmac_sha256(const std::string &key, const std::string &data);

[[nodiscard]] std::string base64url_encode(const std::string &bytes);
[[nodiscard]] common::Result<std::string> base64url_decode(const std::string &text);

/// Comparison whose running time does not depend on where the inputs differ.
[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

} // namespace pairgate::security
