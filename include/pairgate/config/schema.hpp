#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pairgate::config {

struct GatewayConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 5174;
  std::size_t max_body_bytes = 64 * 1024;
};

struct AuthConfig {
  std::string store_path = "~/.pairgate/devices.json";
  std::int64_t token_ttl_days = 365;
  std::int64_t request_window_seconds = 5 * 60;
};

struct TunnelConfig {
  std::string command_path = "cloudflared";
  std::vector<std::string> args = {"tunnel", "--url", "http://localhost:{port}"};
  std::string url_pattern = R"(https?://[^\s]+\.trycloudflare\.com)";
  bool start_with_server = false;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  GatewayConfig gateway;
  AuthConfig auth;
  TunnelConfig tunnel;
  ObservabilityConfig observability;
};

} // namespace pairgate::config
