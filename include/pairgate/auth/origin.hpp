#pragma once

#include <string>

namespace pairgate::auth {

/// Where a call came from. Relayed traffic reaches the gateway from loopback but carries
/// a forwarding header; it is never treated as local.
struct ClientOrigin {
  std::string peer_address;
  std::string forwarded_address; // first hop of X-Forwarded-For / CF-Connecting-IP / X-Real-IP
  bool forwarded = false;
  std::string user_agent;

  [[nodiscard]] bool is_loopback() const;
  [[nodiscard]] std::string client_ip() const;
};

[[nodiscard]] bool is_loopback_address(const std::string &address);

/// Builds an origin from the socket peer and the raw forwarding header values (empty when
/// absent).
[[nodiscard]] ClientOrigin make_origin(const std::string &peer_address,
                                       const std::string &x_forwarded_for,
                                       const std::string &cf_connecting_ip,
                                       const std::string &x_real_ip,
                                       const std::string &user_agent);

} // namespace pairgate::auth
