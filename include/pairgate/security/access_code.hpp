#pragma once

#include <string>

namespace pairgate::security {

/// Six-digit pairing code derived from the registry secret. Stable for a given
/// secret; changes whenever the secret is rotated.
[[nodiscard]] std::string derive_access_code(const std::string &secret);

/// Constant-time check of a submitted code against the one derived from `secret`.
[[nodiscard]] bool access_code_matches(const std::string &secret, const std::string &submitted);

} // namespace pairgate::security
