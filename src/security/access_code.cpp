#include "pairgate/security/access_code.hpp"

#include "pairgate/security/crypto.hpp"

#include <iomanip>
#include <sstream>

namespace pairgate::security {

std::string derive_access_code(const std::string &secret) {
  const std::string digest = sha256_hex(secret);
  const unsigned long prefix = std::stoul(digest.substr(0, 8), nullptr, 16);

  std::ostringstream stream;
  stream << std::setw(6) << std::setfill('0') << (prefix % 1'000'000UL);
  return stream.str();
}

bool access_code_matches(const std::string &secret, const std::string &submitted) {
  return constant_time_equals(derive_access_code(secret), submitted);
}

} // namespace pairgate::security
