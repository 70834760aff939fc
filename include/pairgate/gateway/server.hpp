#pragma once

#include "pairgate/auth/gateway.hpp"
#include "pairgate/common/result.hpp"
#include "pairgate/config/schema.hpp"
#include "pairgate/devices/store.hpp"
#include "pairgate/tunnel/supervisor.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <unordered_map>

namespace pairgate::gateway {

struct GatewayOptions {
  std::string host = "0.0.0.0";
  std::uint16_t port = 5174;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers; // lower-cased keys
  std::unordered_map<std::string, std::string> query;
  std::string body;
  std::string remote_addr;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// HTTP/1.1 boundary for the auth facade and the tunnel supervisor. Connections are
/// served one at a time on a single accept thread.
class GatewayServer {
public:
  GatewayServer(const config::Config &config, auth::AuthGateway &auth,
                devices::DeviceStore &store, tunnel::TunnelSupervisor &tunnel);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] HttpResponse dispatch_for_test(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse route(const HttpRequest &request);

  [[nodiscard]] HttpResponse handle_local_auth(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_verify(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_request_access(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_check_status(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_validate(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_logout(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_code(const HttpRequest &request);

  [[nodiscard]] HttpResponse handle_list_devices(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_revoke_device(const HttpRequest &request,
                                                  const std::string &device_id);
  [[nodiscard]] HttpResponse handle_rename_device(const HttpRequest &request,
                                                  const std::string &device_id);
  [[nodiscard]] HttpResponse handle_revoke_others(const HttpRequest &request);

  [[nodiscard]] HttpResponse handle_list_requests(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_resolve_request(const HttpRequest &request,
                                                    const std::string &request_id, bool approve);
  [[nodiscard]] HttpResponse handle_admin_list_devices(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_admin_revoke_device(const HttpRequest &request,
                                                        const std::string &device_id);
  [[nodiscard]] HttpResponse handle_admin_rename_device(const HttpRequest &request,
                                                        const std::string &device_id);
  [[nodiscard]] HttpResponse handle_admin_revoke_others(const HttpRequest &request,
                                                        const std::string &keep_device_id);
  [[nodiscard]] HttpResponse handle_admin_code(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_admin_rotate_secret(const HttpRequest &request);

  [[nodiscard]] HttpResponse handle_tunnel_start();
  [[nodiscard]] HttpResponse handle_tunnel_stop();
  [[nodiscard]] HttpResponse handle_tunnel_status() const;

  [[nodiscard]] HttpResponse handle_system_info() const;
  [[nodiscard]] HttpResponse handle_is_local(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_health() const;

  void accept_loop();
  void handle_client(int client_fd, const std::string &remote_addr);

  const config::Config &config_;
  auth::AuthGateway &auth_;
  devices::DeviceStore &store_;
  tunnel::TunnelSupervisor &tunnel_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
};

} // namespace pairgate::gateway
