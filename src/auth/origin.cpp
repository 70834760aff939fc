#include "pairgate/auth/origin.hpp"

#include "pairgate/common/fs.hpp"

namespace pairgate::auth {

bool is_loopback_address(const std::string &address) {
  const std::string lowered = common::to_lower(common::trim(address));
  if (lowered == "localhost" || lowered == "::1" || lowered == "[::1]") {
    return true;
  }
  if (common::starts_with(lowered, "127.")) {
    return true;
  }
  return common::starts_with(lowered, "::ffff:127.");
}

bool ClientOrigin::is_loopback() const { return !forwarded && is_loopback_address(peer_address); }

std::string ClientOrigin::client_ip() const {
  return forwarded && !forwarded_address.empty() ? forwarded_address : peer_address;
}

ClientOrigin make_origin(const std::string &peer_address, const std::string &x_forwarded_for,
                         const std::string &cf_connecting_ip, const std::string &x_real_ip,
                         const std::string &user_agent) {
  ClientOrigin origin{.peer_address = peer_address, .user_agent = user_agent};
  if (!cf_connecting_ip.empty()) {
    origin.forwarded = true;
    origin.forwarded_address = common::trim(cf_connecting_ip);
  } else if (!x_forwarded_for.empty()) {
    origin.forwarded = true;
    origin.forwarded_address = common::trim(x_forwarded_for.substr(0, x_forwarded_for.find(',')));
  } else if (!x_real_ip.empty()) {
    origin.forwarded = true;
    origin.forwarded_address = common::trim(x_real_ip);
  }
  return origin;
}

} // namespace pairgate::auth
