#include "pairgate/auth/gateway.hpp"

#include "pairgate/common/fs.hpp"
#include "pairgate/devices/user_agent.hpp"
#include "pairgate/observability/global.hpp"
#include "pairgate/security/access_code.hpp"

namespace pairgate::auth {

namespace {

template <typename T> AuthResult<T> fail(const AuthError error) {
  return AuthResult<T>::failure(error);
}

} // namespace

std::string_view auth_error_name(const AuthError error) {
  switch (error) {
  case AuthError::BadRequest:
    return "bad_request";
  case AuthError::Unauthorized:
    return "unauthorized";
  case AuthError::Forbidden:
    return "forbidden";
  case AuthError::NotFound:
    return "not_found";
  case AuthError::Conflict:
    return "conflict";
  }
  return "unauthorized";
}

AuthGateway::AuthGateway(devices::DeviceStore &store, devices::PendingRequestWorkflow &workflow)
    : store_(store), workflow_(workflow) {}

Session AuthGateway::mint_session(const devices::DeviceDescriptor &device,
                                  const ClientOrigin &origin, const bool is_host,
                                  const std::string_view method) {
  const auto descriptor = devices::complete_descriptor(device, origin.user_agent);
  Session session;
  session.device = store_.create_device(descriptor, origin.client_ip(), is_host);
  session.token = store_.generate_token(session.device.id);
  observability::record_device_authorized(session.device.id, std::string(method),
                                          origin.client_ip());
  observability::record_device_count(store_.device_count());
  return session;
}

AuthResult<Session> AuthGateway::local_auth(const ClientOrigin &origin,
                                            const devices::DeviceDescriptor &device) {
  if (!origin.is_loopback()) {
    observability::record_auth_failure("local-auth", "non-loopback origin", origin.client_ip());
    return fail<Session>(AuthError::Forbidden);
  }
  return AuthResult<Session>::success(mint_session(device, origin, true, "local"));
}

AuthResult<Session> AuthGateway::verify_code(const std::string &code,
                                             const devices::DeviceDescriptor &device,
                                             const ClientOrigin &origin) {
  if (!security::access_code_matches(store_.secret(), common::trim(code))) {
    observability::record_auth_failure("verify", "code mismatch", origin.client_ip());
    return fail<Session>(AuthError::Unauthorized);
  }
  return AuthResult<Session>::success(mint_session(device, origin, false, "code"));
}

AuthResult<devices::PendingRequest>
AuthGateway::request_access(const std::string &code, const devices::DeviceDescriptor &device,
                            const ClientOrigin &origin) {
  if (!security::access_code_matches(store_.secret(), common::trim(code))) {
    observability::record_auth_failure("request-access", "code mismatch", origin.client_ip());
    return fail<devices::PendingRequest>(AuthError::Unauthorized);
  }
  const auto descriptor = devices::complete_descriptor(device, origin.user_agent);
  auto created = workflow_.create(descriptor, origin.client_ip());
  if (!created.ok()) {
    observability::record_error("auth", "request-access: " + created.error());
    return fail<devices::PendingRequest>(AuthError::Conflict);
  }
  observability::record_request_created(created.value().id, origin.client_ip());
  observability::record_pending_requests(workflow_.list().size());
  return AuthResult<devices::PendingRequest>::success(created.value());
}

AuthResult<devices::PendingRequest> AuthGateway::check_status(const std::string &request_id) {
  if (common::trim(request_id).empty()) {
    return fail<devices::PendingRequest>(AuthError::BadRequest);
  }
  auto request = workflow_.status(request_id);
  if (!request.has_value()) {
    return fail<devices::PendingRequest>(AuthError::NotFound);
  }
  if (request->status != devices::RequestStatus::Approved) {
    request->token.reset();
    request->device_id.reset();
  }
  return AuthResult<devices::PendingRequest>::success(std::move(*request));
}

AuthResult<devices::DeviceRecord> AuthGateway::authenticate(const std::string &token,
                                                            const ClientOrigin &origin,
                                                            const std::string_view action) {
  if (token.empty()) {
    observability::record_auth_failure(std::string(action), "missing token", origin.client_ip());
    return fail<devices::DeviceRecord>(AuthError::Unauthorized);
  }
  const auto check = store_.verify_token(token);
  if (!check.valid()) {
    observability::record_auth_failure(std::string(action),
                                       std::string(devices::token_check_name(check.status)),
                                       origin.client_ip());
    return fail<devices::DeviceRecord>(AuthError::Unauthorized);
  }
  auto device = store_.get_device(*check.device_id);
  if (!device.has_value()) {
    // removed between the check and the lookup
    observability::record_auth_failure(std::string(action), "device removed", origin.client_ip());
    return fail<devices::DeviceRecord>(AuthError::Unauthorized);
  }
  return AuthResult<devices::DeviceRecord>::success(std::move(*device));
}

AuthResult<void> AuthGateway::authorize_operator(const std::string &token,
                                                 const ClientOrigin &origin,
                                                 const std::string_view action) {
  if (!token.empty()) {
    const auto caller = authenticate(token, origin, action);
    if (caller.ok() && caller.value().is_host) {
      return AuthResult<void>::success();
    }
  }
  if (origin.is_loopback()) {
    return AuthResult<void>::success();
  }
  observability::record_auth_failure(std::string(action), "operator required", origin.client_ip());
  return AuthResult<void>::failure(AuthError::Forbidden);
}

AuthResult<devices::DeviceRecord> AuthGateway::validate(const std::string &token,
                                                        const ClientOrigin &origin) {
  auto device = authenticate(token, origin, "validate");
  if (!device.ok()) {
    return device;
  }
  (void)store_.update_last_seen(device.value().id, origin.client_ip());
  auto refreshed = store_.get_device(device.value().id);
  if (!refreshed.has_value()) {
    return fail<devices::DeviceRecord>(AuthError::Unauthorized);
  }
  return AuthResult<devices::DeviceRecord>::success(std::move(*refreshed));
}

AuthResult<void> AuthGateway::logout(const std::string &token, const ClientOrigin &origin) {
  const auto device = authenticate(token, origin, "logout");
  if (!device.ok()) {
    return AuthResult<void>::failure(device.error());
  }
  store_.revoke_token(token);
  if (store_.remove_device(device.value().id)) {
    observability::record_device_revoked(device.value().id, "logout");
    observability::record_device_count(store_.device_count());
  }
  return AuthResult<void>::success();
}

AuthResult<std::string> AuthGateway::access_code(const std::string &token,
                                                 const ClientOrigin &origin) {
  const auto device = authenticate(token, origin, "code");
  if (!device.ok()) {
    return fail<std::string>(device.error());
  }
  return AuthResult<std::string>::success(store_.access_code());
}

AuthResult<DeviceListing> AuthGateway::list_devices(const std::string &token,
                                                    const ClientOrigin &origin) {
  const auto device = authenticate(token, origin, "devices");
  if (!device.ok()) {
    return fail<DeviceListing>(device.error());
  }
  return AuthResult<DeviceListing>::success(
      DeviceListing{.devices = store_.list_devices(), .current_device_id = device.value().id});
}

AuthResult<void> AuthGateway::revoke(const std::string &token, const ClientOrigin &origin,
                                     const std::string &target_device_id) {
  const auto caller = authenticate(token, origin, "revoke");
  if (!caller.ok()) {
    return AuthResult<void>::failure(caller.error());
  }
  if (target_device_id == caller.value().id) {
    return AuthResult<void>::failure(AuthError::Conflict);
  }
  if (!store_.remove_device(target_device_id)) {
    return AuthResult<void>::failure(AuthError::NotFound);
  }
  observability::record_device_revoked(target_device_id, "revoked by " + caller.value().id);
  observability::record_device_count(store_.device_count());
  return AuthResult<void>::success();
}

AuthResult<devices::DeviceRecord> AuthGateway::rename(const std::string &token,
                                                      const ClientOrigin &origin,
                                                      const std::string &target_device_id,
                                                      const std::string &name) {
  const auto caller = authenticate(token, origin, "rename");
  if (!caller.ok()) {
    return caller;
  }
  const std::string trimmed = common::trim(name);
  if (trimmed.empty()) {
    return fail<devices::DeviceRecord>(AuthError::BadRequest);
  }
  auto updated = store_.update_device(target_device_id, devices::DeviceUpdate{.name = trimmed});
  if (!updated.has_value()) {
    return fail<devices::DeviceRecord>(AuthError::NotFound);
  }
  return AuthResult<devices::DeviceRecord>::success(std::move(*updated));
}

AuthResult<std::size_t> AuthGateway::revoke_all_except(const std::string &token,
                                                       const ClientOrigin &origin) {
  const auto caller = authenticate(token, origin, "revoke-others");
  if (!caller.ok()) {
    return fail<std::size_t>(caller.error());
  }
  const std::size_t removed = store_.revoke_all_except(caller.value().id);
  if (removed > 0) {
    observability::record_device_revoked("*", "revoke-others by " + caller.value().id);
    observability::record_device_count(store_.device_count());
  }
  return AuthResult<std::size_t>::success(removed);
}

AuthResult<std::vector<devices::PendingRequest>>
AuthGateway::list_pending(const std::string &token, const ClientOrigin &origin) {
  const auto allowed = authorize_operator(token, origin, "admin.requests");
  if (!allowed.ok()) {
    return fail<std::vector<devices::PendingRequest>>(allowed.error());
  }
  return AuthResult<std::vector<devices::PendingRequest>>::success(workflow_.list());
}

AuthResult<devices::PendingRequest> AuthGateway::approve(const std::string &token,
                                                         const ClientOrigin &origin,
                                                         const std::string &request_id) {
  const auto allowed = authorize_operator(token, origin, "admin.approve");
  if (!allowed.ok()) {
    return fail<devices::PendingRequest>(allowed.error());
  }
  auto resolved = workflow_.approve(request_id);
  if (!resolved.has_value()) {
    return fail<devices::PendingRequest>(AuthError::NotFound);
  }
  observability::record_request_resolved(resolved->id, "approved");
  if (resolved->device_id.has_value()) {
    observability::record_device_authorized(*resolved->device_id, "approval", resolved->ip);
  }
  observability::record_device_count(store_.device_count());
  observability::record_pending_requests(workflow_.list().size());
  return AuthResult<devices::PendingRequest>::success(std::move(*resolved));
}

AuthResult<devices::PendingRequest> AuthGateway::deny(const std::string &token,
                                                      const ClientOrigin &origin,
                                                      const std::string &request_id) {
  const auto allowed = authorize_operator(token, origin, "admin.deny");
  if (!allowed.ok()) {
    return fail<devices::PendingRequest>(allowed.error());
  }
  auto resolved = workflow_.deny(request_id);
  if (!resolved.has_value()) {
    return fail<devices::PendingRequest>(AuthError::NotFound);
  }
  observability::record_request_resolved(resolved->id, "denied");
  observability::record_pending_requests(workflow_.list().size());
  return AuthResult<devices::PendingRequest>::success(std::move(*resolved));
}

AuthResult<std::vector<devices::DeviceRecord>>
AuthGateway::admin_list_devices(const std::string &token, const ClientOrigin &origin) {
  if (const auto allowed = authorize_operator(token, origin, "admin.devices"); !allowed.ok()) {
    return fail<std::vector<devices::DeviceRecord>>(allowed.error());
  }
  return AuthResult<std::vector<devices::DeviceRecord>>::success(store_.list_devices());
}

AuthResult<void> AuthGateway::admin_revoke(const std::string &token, const ClientOrigin &origin,
                                           const std::string &target_device_id) {
  if (const auto allowed = authorize_operator(token, origin, "admin.revoke"); !allowed.ok()) {
    return allowed;
  }
  if (!store_.remove_device(target_device_id)) {
    return AuthResult<void>::failure(AuthError::NotFound);
  }
  observability::record_device_revoked(target_device_id, "revoked by operator");
  observability::record_device_count(store_.device_count());
  return AuthResult<void>::success();
}

AuthResult<devices::DeviceRecord> AuthGateway::admin_rename(const std::string &token,
                                                            const ClientOrigin &origin,
                                                            const std::string &target_device_id,
                                                            const std::string &name) {
  if (const auto allowed = authorize_operator(token, origin, "admin.rename"); !allowed.ok()) {
    return fail<devices::DeviceRecord>(allowed.error());
  }
  const std::string trimmed = common::trim(name);
  if (trimmed.empty()) {
    return fail<devices::DeviceRecord>(AuthError::BadRequest);
  }
  auto updated = store_.update_device(target_device_id, devices::DeviceUpdate{.name = trimmed});
  if (!updated.has_value()) {
    return fail<devices::DeviceRecord>(AuthError::NotFound);
  }
  return AuthResult<devices::DeviceRecord>::success(std::move(*updated));
}

AuthResult<std::size_t> AuthGateway::admin_revoke_all_except(const std::string &token,
                                                             const ClientOrigin &origin,
                                                             const std::string &keep_device_id) {
  if (const auto allowed = authorize_operator(token, origin, "admin.revoke-others");
      !allowed.ok()) {
    return fail<std::size_t>(allowed.error());
  }
  if (!store_.get_device(keep_device_id).has_value()) {
    return fail<std::size_t>(AuthError::NotFound);
  }
  const std::size_t removed = store_.revoke_all_except(keep_device_id);
  if (removed > 0) {
    observability::record_device_revoked("*", "revoke-others by operator");
    observability::record_device_count(store_.device_count());
  }
  return AuthResult<std::size_t>::success(removed);
}

AuthResult<std::string> AuthGateway::admin_access_code(const std::string &token,
                                                       const ClientOrigin &origin) {
  if (const auto allowed = authorize_operator(token, origin, "admin.code"); !allowed.ok()) {
    return fail<std::string>(allowed.error());
  }
  return AuthResult<std::string>::success(store_.access_code());
}

AuthResult<std::string> AuthGateway::admin_rotate_secret(const std::string &token,
                                                         const ClientOrigin &origin) {
  if (const auto allowed = authorize_operator(token, origin, "admin.rotate-secret");
      !allowed.ok()) {
    return fail<std::string>(allowed.error());
  }
  store_.rotate_secret();
  return AuthResult<std::string>::success(store_.access_code());
}

} // namespace pairgate::auth
