#include "pairgate/cli/admin_client.hpp"

#include "pairgate/common/json_util.hpp"
#include "pairgate/config/config.hpp"
#include "pairgate/devices/store_lock.hpp"

#include <cctype>
#include <cstdio>

namespace pairgate::cli {

namespace {

constexpr std::uint64_t GATEWAY_TIMEOUT_MS = 5000;

std::string unknown_device(const std::string &id) { return "unknown device: " + id; }
std::string unknown_request(const std::string &id) { return "no pending request: " + id; }

std::string local_failure(const auth::AuthError error, const std::string &not_found) {
  switch (error) {
  case auth::AuthError::NotFound:
    return not_found;
  case auth::AuthError::BadRequest:
    return "name must not be empty";
  default:
    return std::string("refused: ") + std::string(auth::auth_error_name(error));
  }
}

std::string remote_failure(const common::HttpClientResponse &response, const std::uint16_t port,
                           const std::string &not_found) {
  if (response.network_error) {
    return "gateway on port " + std::to_string(port) + " not reachable: " +
           response.network_error_message;
  }
  switch (response.status) {
  case 400:
    return "name must not be empty";
  case 403:
    return "gateway refused operator access";
  case 404:
    return not_found;
  default:
    return "gateway returned HTTP " + std::to_string(response.status);
  }
}

// Percent-encodes everything outside the unreserved set.
std::string path_segment(const std::string &value) {
  std::string out;
  for (const unsigned char ch : value) {
    if (std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", ch);
      out += buf;
    }
  }
  return out;
}

std::string member(const std::string &json, const std::string &key) {
  const auto fields = common::json_parse_flat(json);
  const auto it = fields.find(key);
  return it == fields.end() ? std::string() : it->second;
}

template <typename T, typename Parse>
common::Result<std::vector<T>> parse_list(const std::string &body, const std::string &key,
                                          Parse parse) {
  const auto elements = common::json_parse_array(member(body, key));
  if (!elements.has_value()) {
    return common::Result<std::vector<T>>::failure("malformed gateway response");
  }
  std::vector<T> out;
  for (const auto &element : *elements) {
    auto parsed = parse(element);
    if (!parsed.ok()) {
      return common::Result<std::vector<T>>::failure("malformed gateway response: " +
                                                     parsed.error());
    }
    out.push_back(std::move(parsed.value()));
  }
  return common::Result<std::vector<T>>::success(std::move(out));
}

} // namespace

// ── Local ─────────────────────────────────────────────────────────────────────

LocalAdminClient::LocalAdminClient(const config::Config &config)
    : store_(config::store_path(config), config::token_ttl_seconds(config)),
      workflow_(store_, config::request_window_ms(config)), auth_(store_, workflow_),
      origin_(auth::make_origin("127.0.0.1", "", "", "", "pairgate-cli")) {}

common::Result<std::vector<devices::DeviceRecord>> LocalAdminClient::list_devices() {
  auto listed = auth_.admin_list_devices("", origin_);
  if (!listed.ok()) {
    return common::Result<std::vector<devices::DeviceRecord>>::failure(
        local_failure(listed.error(), ""));
  }
  return common::Result<std::vector<devices::DeviceRecord>>::success(std::move(listed.value()));
}

common::Status LocalAdminClient::revoke_device(const std::string &device_id) {
  const auto revoked = auth_.admin_revoke("", origin_, device_id);
  if (!revoked.ok()) {
    return common::Status::error(local_failure(revoked.error(), unknown_device(device_id)));
  }
  return common::Status::success();
}

common::Result<devices::DeviceRecord> LocalAdminClient::rename_device(const std::string &device_id,
                                                                      const std::string &name) {
  auto renamed = auth_.admin_rename("", origin_, device_id, name);
  if (!renamed.ok()) {
    return common::Result<devices::DeviceRecord>::failure(
        local_failure(renamed.error(), unknown_device(device_id)));
  }
  return common::Result<devices::DeviceRecord>::success(std::move(renamed.value()));
}

common::Result<std::size_t> LocalAdminClient::revoke_others(const std::string &keep_device_id) {
  const auto removed = auth_.admin_revoke_all_except("", origin_, keep_device_id);
  if (!removed.ok()) {
    return common::Result<std::size_t>::failure(
        local_failure(removed.error(), unknown_device(keep_device_id)));
  }
  return common::Result<std::size_t>::success(removed.value());
}

common::Result<std::vector<devices::PendingRequest>> LocalAdminClient::list_requests() {
  auto pending = auth_.list_pending("", origin_);
  if (!pending.ok()) {
    return common::Result<std::vector<devices::PendingRequest>>::failure(
        local_failure(pending.error(), ""));
  }
  return common::Result<std::vector<devices::PendingRequest>>::success(
      std::move(pending.value()));
}

common::Result<devices::PendingRequest>
LocalAdminClient::resolve_request(const std::string &request_id, const bool approve) {
  auto resolved = approve ? auth_.approve("", origin_, request_id)
                          : auth_.deny("", origin_, request_id);
  if (!resolved.ok()) {
    return common::Result<devices::PendingRequest>::failure(
        local_failure(resolved.error(), unknown_request(request_id)));
  }
  // the requester collects the token through check-status
  devices::PendingRequest view = std::move(resolved.value());
  view.token.reset();
  return common::Result<devices::PendingRequest>::success(std::move(view));
}

common::Result<std::string> LocalAdminClient::access_code() {
  auto code = auth_.admin_access_code("", origin_);
  if (!code.ok()) {
    return common::Result<std::string>::failure(local_failure(code.error(), ""));
  }
  return common::Result<std::string>::success(std::move(code.value()));
}

common::Result<std::string> LocalAdminClient::rotate_secret() {
  auto code = auth_.admin_rotate_secret("", origin_);
  if (!code.ok()) {
    return common::Result<std::string>::failure(local_failure(code.error(), ""));
  }
  return common::Result<std::string>::success(std::move(code.value()));
}

// ── Remote ────────────────────────────────────────────────────────────────────

RemoteAdminClient::RemoteAdminClient(std::unique_ptr<common::HttpClient> http,
                                     const std::uint16_t port)
    : http_(std::move(http)), port_(port) {}

common::HttpClientResponse RemoteAdminClient::call(const std::string &method,
                                                   const std::string &path,
                                                   const std::optional<std::string> &body) {
  const std::string url = "http://127.0.0.1:" + std::to_string(port_) + path;
  return http_->request(method, url, {}, body, GATEWAY_TIMEOUT_MS);
}

common::Result<std::vector<devices::DeviceRecord>> RemoteAdminClient::list_devices() {
  const auto response = call("GET", "/api/admin/devices");
  if (response.network_error || response.status != 200) {
    return common::Result<std::vector<devices::DeviceRecord>>::failure(
        remote_failure(response, port_, ""));
  }
  return parse_list<devices::DeviceRecord>(response.body, "devices", devices::parse_device_json);
}

common::Status RemoteAdminClient::revoke_device(const std::string &device_id) {
  const auto response = call("DELETE", "/api/admin/devices/" + path_segment(device_id));
  if (response.network_error || response.status != 200) {
    return common::Status::error(remote_failure(response, port_, unknown_device(device_id)));
  }
  return common::Status::success();
}

common::Result<devices::DeviceRecord> RemoteAdminClient::rename_device(const std::string &device_id,
                                                                       const std::string &name) {
  const auto response = call("PUT", "/api/admin/devices/" + path_segment(device_id) + "/name",
                             "{\"name\":" + common::json_string(name) + "}");
  if (response.network_error || response.status != 200) {
    return common::Result<devices::DeviceRecord>::failure(
        remote_failure(response, port_, unknown_device(device_id)));
  }
  return devices::parse_device_json(member(response.body, "device"));
}

common::Result<std::size_t> RemoteAdminClient::revoke_others(const std::string &keep_device_id) {
  const auto response =
      call("POST", "/api/admin/devices/" + path_segment(keep_device_id) + "/revoke-others");
  if (response.network_error || response.status != 200) {
    return common::Result<std::size_t>::failure(
        remote_failure(response, port_, unknown_device(keep_device_id)));
  }
  const auto count = common::json_to_int64(member(response.body, "revokedCount"));
  if (!count.has_value() || *count < 0) {
    return common::Result<std::size_t>::failure("malformed gateway response");
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(*count));
}

common::Result<std::vector<devices::PendingRequest>> RemoteAdminClient::list_requests() {
  const auto response = call("GET", "/api/admin/requests");
  if (response.network_error || response.status != 200) {
    return common::Result<std::vector<devices::PendingRequest>>::failure(
        remote_failure(response, port_, ""));
  }
  return parse_list<devices::PendingRequest>(response.body, "requests",
                                             devices::parse_request_json);
}

common::Result<devices::PendingRequest>
RemoteAdminClient::resolve_request(const std::string &request_id, const bool approve) {
  const auto response = call("POST", "/api/admin/requests/" + path_segment(request_id) +
                                         (approve ? "/approve" : "/deny"));
  if (response.network_error || response.status != 200) {
    return common::Result<devices::PendingRequest>::failure(
        remote_failure(response, port_, unknown_request(request_id)));
  }
  return devices::parse_request_json(member(response.body, "request"));
}

common::Result<std::string> RemoteAdminClient::access_code() {
  const auto response = call("GET", "/api/admin/code");
  if (response.network_error || response.status != 200) {
    return common::Result<std::string>::failure(remote_failure(response, port_, ""));
  }
  return common::Result<std::string>::success(common::json_get_string(response.body, "code"));
}

common::Result<std::string> RemoteAdminClient::rotate_secret() {
  const auto response = call("POST", "/api/admin/rotate-secret");
  if (response.network_error || response.status != 200) {
    return common::Result<std::string>::failure(remote_failure(response, port_, ""));
  }
  return common::Result<std::string>::success(common::json_get_string(response.body, "code"));
}

std::unique_ptr<AdminClient> open_admin_client(const config::Config &config) {
  if (const auto owner = devices::StoreLock::owner(config::store_path(config))) {
    return std::make_unique<RemoteAdminClient>(std::make_unique<common::CurlHttpClient>(),
                                               owner->port);
  }
  return std::make_unique<LocalAdminClient>(config);
}

} // namespace pairgate::cli
