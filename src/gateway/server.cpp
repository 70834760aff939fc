#include "pairgate/gateway/server.hpp"

#include "pairgate/common/fs.hpp"
#include "pairgate/common/json_util.hpp"
#include "pairgate/devices/device.hpp"
#include "pairgate/observability/global.hpp"
#include "pairgate/version.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <sstream>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pairgate::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderSize = 16 * 1024;

using common::json_string;

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const std::string lowered = common::to_lower(key);
  auto it = request.headers.find(lowered);
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::string status_text(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "OK";
  }
}

int hex_digit(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string url_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      out.push_back(' ');
    } else if (value[i] == '%' && i + 2 < value.size() && hex_digit(value[i + 1]) >= 0 &&
               hex_digit(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_digit(value[i + 1]) * 16 + hex_digit(value[i + 2])));
      i += 2;
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[url_decode(part)] = "";
      continue;
    }
    out[url_decode(part.substr(0, eq))] = url_decode(part.substr(eq + 1));
  }
  return out;
}

HttpResponse make_json_response(int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse error_response(const auth::AuthError error) {
  switch (error) {
  case auth::AuthError::BadRequest:
    return make_json_response(400, R"({"error":"bad_request"})");
  case auth::AuthError::Unauthorized:
    return make_json_response(401, R"({"error":"unauthorized"})");
  case auth::AuthError::Forbidden:
    return make_json_response(403, R"({"error":"forbidden"})");
  case auth::AuthError::NotFound:
    return make_json_response(404, R"({"error":"not_found"})");
  case auth::AuthError::Conflict:
    return make_json_response(409, R"({"error":"conflict"})");
  }
  return make_json_response(401, R"({"error":"unauthorized"})");
}

HttpResponse invalid_body() { return make_json_response(400, R"({"error":"invalid_json"})"); }

/// Top-level fields of a JSON body; an empty body reads as `{}`.
std::optional<common::JsonFlatMap> parse_body(const HttpRequest &request) {
  if (common::trim(request.body).empty()) {
    return common::JsonFlatMap{};
  }
  if (!common::json_is_object(request.body)) {
    return std::nullopt;
  }
  return common::json_parse_flat(request.body);
}

std::string field(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? "" : it->second;
}

devices::DeviceDescriptor descriptor_from_body(const common::JsonFlatMap &fields) {
  devices::DeviceDescriptor descriptor;
  const std::string nested = field(fields, "device");
  if (!nested.empty() && nested.front() == '{') {
    descriptor = devices::parse_descriptor_json(nested);
  }
  if (descriptor.name.empty()) {
    descriptor.name = !field(fields, "deviceName").empty() ? field(fields, "deviceName")
                                                           : field(fields, "name");
  }
  if (descriptor.platform.empty()) {
    descriptor.platform = field(fields, "platform");
  }
  if (descriptor.browser.empty()) {
    descriptor.browser = field(fields, "browser");
  }
  descriptor.name = common::trim(descriptor.name);
  return descriptor;
}

std::string bearer_token(const HttpRequest &request) {
  const std::string authorization = common::trim(header_lookup(request, "authorization"));
  if (authorization.size() < 7 || common::to_lower(authorization.substr(0, 7)) != "bearer ") {
    return "";
  }
  return common::trim(authorization.substr(7));
}

auth::ClientOrigin origin_of(const HttpRequest &request) {
  return auth::make_origin(request.remote_addr, header_lookup(request, "x-forwarded-for"),
                           header_lookup(request, "cf-connecting-ip"),
                           header_lookup(request, "x-real-ip"),
                           header_lookup(request, "user-agent"));
}

std::string session_json(const auth::Session &session) {
  return "{\"success\":true,\"token\":" + json_string(session.token) +
         ",\"deviceId\":" + json_string(session.device.id) +
         ",\"device\":" + devices::encode_device_json(session.device) + "}";
}

/// Request as shown to the operator; the minted token only ever goes to the requester.
std::string operator_request_json(devices::PendingRequest request) {
  request.token.reset();
  return devices::encode_request_json(request);
}

std::vector<std::string> split_path(const std::string &path) {
  std::vector<std::string> parts;
  std::stringstream stream(path);
  std::string part;
  while (std::getline(stream, part, '/')) {
    if (!part.empty()) {
      parts.push_back(url_decode(part));
    }
  }
  return parts;
}

std::string first_lan_ipv4() {
  ifaddrs *interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0) {
    return "127.0.0.1";
  }
  std::string found;
  for (ifaddrs *it = interfaces; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    const auto *addr = reinterpret_cast<const sockaddr_in *>(it->ifa_addr);
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)) == nullptr) {
      continue;
    }
    const std::string candidate = buf;
    if (!common::starts_with(candidate, "127.")) {
      found = candidate;
      break;
    }
  }
  freeifaddrs(interfaces);
  return found.empty() ? "127.0.0.1" : found;
}

} // namespace

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request");
  }

  const std::string headers_part = raw.substr(0, header_end);
  const std::string body = raw.substr(header_end + 4);

  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    request.headers[key] = common::trim(line.substr(colon + 1));
  }

  request.body = body;
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

GatewayServer::GatewayServer(const config::Config &config, auth::AuthGateway &auth,
                             devices::DeviceStore &store, tunnel::TunnelSupervisor &tunnel)
    : config_(config), auth_(auth), store_(store), tunnel_(tunnel) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error("gateway already running");
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  const std::string host =
      common::to_lower(options.host) == "localhost" ? "127.0.0.1" : options.host;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this] { accept_loop(); });
  return common::Status::success();
}

void GatewayServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

HttpResponse GatewayServer::dispatch_for_test(const HttpRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  HttpResponse response;
  if (request.body.size() > config_.gateway.max_body_bytes) {
    response = make_json_response(413, R"({"error":"request_too_large"})");
  } else {
    response = route(request);
  }
  observability::record_request_latency(
      request.method + " " + request.path,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started));
  return response;
}

HttpResponse GatewayServer::route(const HttpRequest &request) {
  const std::string &method = request.method;
  const std::string &path = request.path;

  if (method == "GET" && path == "/health") {
    return handle_health();
  }

  if (method == "POST" && path == "/api/auth/local-auth") {
    return handle_local_auth(request);
  }
  if (method == "POST" && path == "/api/auth/verify") {
    return handle_verify(request);
  }
  if (method == "POST" && path == "/api/auth/request-access") {
    return handle_request_access(request);
  }
  if (method == "GET" && path == "/api/auth/check-status") {
    return handle_check_status(request);
  }
  if ((method == "GET" || method == "POST") && path == "/api/auth/validate") {
    return handle_validate(request);
  }
  if (method == "POST" && path == "/api/auth/logout") {
    return handle_logout(request);
  }
  if (method == "GET" && path == "/api/auth/code") {
    return handle_code(request);
  }

  if (method == "GET" && path == "/api/devices") {
    return handle_list_devices(request);
  }
  if (method == "POST" && path == "/api/devices/revoke-others") {
    return handle_revoke_others(request);
  }
  if (method == "GET" && path == "/api/admin/requests") {
    return handle_list_requests(request);
  }
  if (method == "GET" && path == "/api/admin/devices") {
    return handle_admin_list_devices(request);
  }
  if (method == "GET" && path == "/api/admin/code") {
    return handle_admin_code(request);
  }
  if (method == "POST" && path == "/api/admin/rotate-secret") {
    return handle_admin_rotate_secret(request);
  }

  if (method == "POST" && path == "/api/tunnel/start") {
    return handle_tunnel_start();
  }
  if (method == "POST" && path == "/api/tunnel/stop") {
    return handle_tunnel_stop();
  }
  if (method == "GET" && path == "/api/tunnel/status") {
    return handle_tunnel_status();
  }

  if (method == "GET" && path == "/api/system/info") {
    return handle_system_info();
  }
  if (method == "GET" && path == "/api/system/is-local") {
    return handle_is_local(request);
  }

  const auto parts = split_path(path);
  // /api/devices/<id> and /api/devices/<id>/name
  if (parts.size() >= 3 && parts[0] == "api" && parts[1] == "devices") {
    if (method == "DELETE" && parts.size() == 3) {
      return handle_revoke_device(request, parts[2]);
    }
    if (method == "PUT" && parts.size() == 4 && parts[3] == "name") {
      return handle_rename_device(request, parts[2]);
    }
  }
  // /api/admin/devices/<id>, /api/admin/devices/<id>/name, /api/admin/devices/<id>/revoke-others
  if (parts.size() >= 4 && parts[0] == "api" && parts[1] == "admin" && parts[2] == "devices") {
    if (method == "DELETE" && parts.size() == 4) {
      return handle_admin_revoke_device(request, parts[3]);
    }
    if (method == "PUT" && parts.size() == 5 && parts[4] == "name") {
      return handle_admin_rename_device(request, parts[3]);
    }
    if (method == "POST" && parts.size() == 5 && parts[4] == "revoke-others") {
      return handle_admin_revoke_others(request, parts[3]);
    }
  }
  // /api/admin/requests/<id>/approve|deny
  if (method == "POST" && parts.size() == 5 && parts[0] == "api" && parts[1] == "admin" &&
      parts[2] == "requests") {
    if (parts[4] == "approve") {
      return handle_resolve_request(request, parts[3], true);
    }
    if (parts[4] == "deny") {
      return handle_resolve_request(request, parts[3], false);
    }
  }

  return make_json_response(404, R"({"error":"not_found"})");
}

HttpResponse GatewayServer::handle_local_auth(const HttpRequest &request) {
  const auto body = parse_body(request);
  if (!body.has_value()) {
    return invalid_body();
  }
  const auto session = auth_.local_auth(origin_of(request), descriptor_from_body(*body));
  if (!session.ok()) {
    return error_response(session.error());
  }
  return make_json_response(200, session_json(session.value()));
}

HttpResponse GatewayServer::handle_verify(const HttpRequest &request) {
  const auto body = parse_body(request);
  if (!body.has_value()) {
    return invalid_body();
  }
  const auto session =
      auth_.verify_code(field(*body, "code"), descriptor_from_body(*body), origin_of(request));
  if (!session.ok()) {
    return error_response(session.error());
  }
  return make_json_response(200, session_json(session.value()));
}

HttpResponse GatewayServer::handle_request_access(const HttpRequest &request) {
  const auto body = parse_body(request);
  if (!body.has_value()) {
    return invalid_body();
  }
  const auto created =
      auth_.request_access(field(*body, "code"), descriptor_from_body(*body), origin_of(request));
  if (!created.ok()) {
    return error_response(created.error());
  }
  return make_json_response(200, "{\"success\":true,\"requestId\":" +
                                     json_string(created.value().id) + "}");
}

HttpResponse GatewayServer::handle_check_status(const HttpRequest &request) {
  const auto it = request.query.find("requestId");
  const auto status = auth_.check_status(it == request.query.end() ? "" : it->second);
  if (!status.ok()) {
    if (status.error() == auth::AuthError::NotFound) {
      return make_json_response(404, R"({"status":"not_found"})");
    }
    return error_response(status.error());
  }

  const auto &pending = status.value();
  std::ostringstream body;
  body << "{\"status\":" << json_string(std::string(devices::request_status_name(pending.status)));
  if (pending.token.has_value()) {
    body << ",\"token\":" << json_string(*pending.token);
  }
  if (pending.device_id.has_value()) {
    body << ",\"deviceId\":" << json_string(*pending.device_id);
  }
  body << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_validate(const HttpRequest &request) {
  const auto device = auth_.validate(bearer_token(request), origin_of(request));
  if (!device.ok()) {
    return error_response(device.error());
  }
  return make_json_response(200, "{\"valid\":true,\"deviceId\":" +
                                     json_string(device.value().id) + ",\"device\":" +
                                     devices::encode_device_json(device.value()) + "}");
}

HttpResponse GatewayServer::handle_logout(const HttpRequest &request) {
  const auto result = auth_.logout(bearer_token(request), origin_of(request));
  if (!result.ok()) {
    return error_response(result.error());
  }
  return make_json_response(200, R"({"success":true})");
}

HttpResponse GatewayServer::handle_code(const HttpRequest &request) {
  const auto code = auth_.access_code(bearer_token(request), origin_of(request));
  if (!code.ok()) {
    return error_response(code.error());
  }
  return make_json_response(200, "{\"code\":" + json_string(code.value()) + "}");
}

HttpResponse GatewayServer::handle_list_devices(const HttpRequest &request) {
  const auto listing = auth_.list_devices(bearer_token(request), origin_of(request));
  if (!listing.ok()) {
    return error_response(listing.error());
  }
  std::ostringstream body;
  body << "{\"devices\":[";
  const auto &devices = listing.value().devices;
  for (std::size_t i = 0; i < devices.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << devices::encode_device_json(devices[i]);
  }
  body << "],\"currentDeviceId\":" << json_string(listing.value().current_device_id) << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_revoke_device(const HttpRequest &request,
                                                 const std::string &device_id) {
  const auto result = auth_.revoke(bearer_token(request), origin_of(request), device_id);
  if (!result.ok()) {
    return error_response(result.error());
  }
  return make_json_response(200, R"({"success":true})");
}

HttpResponse GatewayServer::handle_rename_device(const HttpRequest &request,
                                                 const std::string &device_id) {
  const auto body = parse_body(request);
  if (!body.has_value()) {
    return invalid_body();
  }
  const auto device =
      auth_.rename(bearer_token(request), origin_of(request), device_id, field(*body, "name"));
  if (!device.ok()) {
    return error_response(device.error());
  }
  return make_json_response(200, "{\"success\":true,\"device\":" +
                                     devices::encode_device_json(device.value()) + "}");
}

HttpResponse GatewayServer::handle_revoke_others(const HttpRequest &request) {
  const auto removed = auth_.revoke_all_except(bearer_token(request), origin_of(request));
  if (!removed.ok()) {
    return error_response(removed.error());
  }
  return make_json_response(200, "{\"success\":true,\"revokedCount\":" +
                                     std::to_string(removed.value()) + "}");
}

HttpResponse GatewayServer::handle_list_requests(const HttpRequest &request) {
  const auto pending = auth_.list_pending(bearer_token(request), origin_of(request));
  if (!pending.ok()) {
    return error_response(pending.error());
  }
  std::ostringstream body;
  body << "{\"requests\":[";
  const auto &requests = pending.value();
  for (std::size_t i = 0; i < requests.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << operator_request_json(requests[i]);
  }
  body << "]}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_resolve_request(const HttpRequest &request,
                                                   const std::string &request_id,
                                                   const bool approve) {
  const std::string token = bearer_token(request);
  const auto origin = origin_of(request);
  const auto resolved = approve ? auth_.approve(token, origin, request_id)
                                : auth_.deny(token, origin, request_id);
  if (!resolved.ok()) {
    return error_response(resolved.error());
  }
  return make_json_response(200, "{\"success\":true,\"request\":" +
                                     operator_request_json(resolved.value()) + "}");
}

HttpResponse GatewayServer::handle_admin_list_devices(const HttpRequest &request) {
  const auto listing = auth_.admin_list_devices(bearer_token(request), origin_of(request));
  if (!listing.ok()) {
    return error_response(listing.error());
  }
  std::ostringstream body;
  body << "{\"devices\":[";
  for (std::size_t i = 0; i < listing.value().size(); ++i) {
    body << (i == 0 ? "" : ",") << devices::encode_device_json(listing.value()[i]);
  }
  body << "]}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_admin_revoke_device(const HttpRequest &request,
                                                       const std::string &device_id) {
  const auto result = auth_.admin_revoke(bearer_token(request), origin_of(request), device_id);
  if (!result.ok()) {
    return error_response(result.error());
  }
  return make_json_response(200, R"({"success":true})");
}

HttpResponse GatewayServer::handle_admin_rename_device(const HttpRequest &request,
                                                       const std::string &device_id) {
  const auto body = parse_body(request);
  if (!body.has_value()) {
    return invalid_body();
  }
  const auto device = auth_.admin_rename(bearer_token(request), origin_of(request), device_id,
                                         field(*body, "name"));
  if (!device.ok()) {
    return error_response(device.error());
  }
  return make_json_response(200, "{\"success\":true,\"device\":" +
                                     devices::encode_device_json(device.value()) + "}");
}

HttpResponse GatewayServer::handle_admin_revoke_others(const HttpRequest &request,
                                                       const std::string &keep_device_id) {
  const auto removed =
      auth_.admin_revoke_all_except(bearer_token(request), origin_of(request), keep_device_id);
  if (!removed.ok()) {
    return error_response(removed.error());
  }
  return make_json_response(200, "{\"success\":true,\"revokedCount\":" +
                                     std::to_string(removed.value()) + "}");
}

HttpResponse GatewayServer::handle_admin_code(const HttpRequest &request) {
  const auto code = auth_.admin_access_code(bearer_token(request), origin_of(request));
  if (!code.ok()) {
    return error_response(code.error());
  }
  return make_json_response(200, "{\"code\":" + json_string(code.value()) + "}");
}

HttpResponse GatewayServer::handle_admin_rotate_secret(const HttpRequest &request) {
  const auto code = auth_.admin_rotate_secret(bearer_token(request), origin_of(request));
  if (!code.ok()) {
    return error_response(code.error());
  }
  return make_json_response(200, "{\"success\":true,\"code\":" + json_string(code.value()) +
                                     "}");
}

HttpResponse GatewayServer::handle_tunnel_start() {
  const std::uint16_t local_port = bound_port_ != 0 ? bound_port_ : config_.gateway.port;
  return make_json_response(200, tunnel::encode_tunnel_state_json(tunnel_.start(local_port)));
}

HttpResponse GatewayServer::handle_tunnel_stop() {
  return make_json_response(200, tunnel::encode_tunnel_state_json(tunnel_.stop()));
}

HttpResponse GatewayServer::handle_tunnel_status() const {
  return make_json_response(200, tunnel::encode_tunnel_state_json(tunnel_.info()));
}

HttpResponse GatewayServer::handle_system_info() const {
  const std::uint16_t local_port = bound_port_ != 0 ? bound_port_ : config_.gateway.port;
  return make_json_response(200, "{\"localIp\":" + json_string(first_lan_ipv4()) +
                                     ",\"port\":" + std::to_string(local_port) + "}");
}

HttpResponse GatewayServer::handle_is_local(const HttpRequest &request) const {
  return make_json_response(200, std::string("{\"isLocal\":") +
                                     (origin_of(request).is_loopback() ? "true" : "false") + "}");
}

HttpResponse GatewayServer::handle_health() const {
  const auto tunnel_state = tunnel_.info();
  std::ostringstream body;
  body << "{";
  body << "\"status\":\"ok\",";
  body << "\"version\":" << json_string(VERSION) << ",";
  body << "\"tunnel\":" << json_string(std::string(tunnel::tunnel_status_name(tunnel_state.status)))
       << ",";
  body << "\"devices\":" << store_.device_count();
  body << "}";
  return make_json_response(200, body.str());
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    // close-on-exec: a relay spawned while serving must not hold the client open
    int client =
        accept4(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len, SOCK_CLOEXEC);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    char buf[INET_ADDRSTRLEN] = {0};
    const char *addr = inet_ntop(AF_INET, &client_addr.sin_addr, buf, sizeof(buf));
    handle_client(client, addr != nullptr ? std::string(addr) : std::string());
    close(client);
  }
}

void GatewayServer::handle_client(int client_fd, const std::string &remote_addr) {
  const std::size_t max_body = config_.gateway.max_body_bytes;
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  timeval timeout{};
  timeout.tv_sec = 10;
  setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < (max_body + kMaxHeaderSize)) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (!header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        header_parsed = true;
        auto parsed = parse_http_request(raw.substr(0, header_end + 4));
        if (parsed.ok()) {
          const std::string cl = header_lookup(parsed.value(), "content-length");
          if (!cl.empty()) {
            try {
              content_length = static_cast<std::size_t>(std::stoull(cl));
            } catch (const std::exception &) {
              const auto text = render_http_response(
                  make_json_response(400, R"({"error":"invalid_content_length"})"));
              send(client_fd, text.data(), text.size(), MSG_NOSIGNAL);
              return;
            }
          }
        }
        if (content_length > max_body) {
          const auto text = render_http_response(
              make_json_response(413, R"({"error":"request_too_large"})"));
          send(client_fd, text.data(), text.size(), MSG_NOSIGNAL);
          return;
        }
      } else if (raw.size() > kMaxHeaderSize) {
        break;
      }
    }

    if (header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length) {
        break;
      }
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    response = make_json_response(400, R"({"error":"invalid_request"})");
  } else {
    HttpRequest request = std::move(parsed.value());
    request.remote_addr = remote_addr;
    if (request.body.size() > content_length) {
      request.body.resize(content_length);
    }
    response = dispatch_for_test(request);
  }
  const std::string text = render_http_response(response);
  send(client_fd, text.data(), text.size(), MSG_NOSIGNAL);
}

} // namespace pairgate::gateway
