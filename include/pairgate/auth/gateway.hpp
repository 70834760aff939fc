#pragma once

#include "pairgate/auth/origin.hpp"
#include "pairgate/common/result.hpp"
#include "pairgate/devices/device.hpp"
#include "pairgate/devices/requests.hpp"
#include "pairgate/devices/store.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pairgate::auth {

// ── Errors ────────────────────────────────────────────────────────────────────

enum class AuthError { BadRequest, Unauthorized, Forbidden, NotFound, Conflict };

[[nodiscard]] std::string_view auth_error_name(AuthError error);

template <typename T> using AuthResult = common::Result<T, AuthError>;

// ── Results ───────────────────────────────────────────────────────────────────

struct Session {
  devices::DeviceRecord device;
  std::string token;
};

struct DeviceListing {
  std::vector<devices::DeviceRecord> devices;
  std::string current_device_id;
};

// ── Facade ────────────────────────────────────────────────────────────────────

/// Login, pairing and session checks on top of DeviceStore and the request workflow.
/// Every token failure collapses to AuthError::Unauthorized; the cause is only logged.
class AuthGateway {
public:
  AuthGateway(devices::DeviceStore &store, devices::PendingRequestWorkflow &workflow);

  /// Loopback callers get a host device without a code.
  [[nodiscard]] AuthResult<Session> local_auth(const ClientOrigin &origin,
                                               const devices::DeviceDescriptor &device);
  [[nodiscard]] AuthResult<Session> verify_code(const std::string &code,
                                                const devices::DeviceDescriptor &device,
                                                const ClientOrigin &origin);
  [[nodiscard]] AuthResult<devices::PendingRequest>
  request_access(const std::string &code, const devices::DeviceDescriptor &device,
                 const ClientOrigin &origin);
  /// Effective request state; token and deviceId are only present once approved.
  [[nodiscard]] AuthResult<devices::PendingRequest> check_status(const std::string &request_id);

  /// Resolves the bearer token to its device and refreshes last-seen.
  [[nodiscard]] AuthResult<devices::DeviceRecord> validate(const std::string &token,
                                                           const ClientOrigin &origin);
  [[nodiscard]] AuthResult<void> logout(const std::string &token, const ClientOrigin &origin);
  [[nodiscard]] AuthResult<std::string> access_code(const std::string &token,
                                                    const ClientOrigin &origin);

  [[nodiscard]] AuthResult<DeviceListing> list_devices(const std::string &token,
                                                       const ClientOrigin &origin);
  [[nodiscard]] AuthResult<void> revoke(const std::string &token, const ClientOrigin &origin,
                                        const std::string &target_device_id);
  [[nodiscard]] AuthResult<devices::DeviceRecord> rename(const std::string &token,
                                                         const ClientOrigin &origin,
                                                         const std::string &target_device_id,
                                                         const std::string &name);
  [[nodiscard]] AuthResult<std::size_t> revoke_all_except(const std::string &token,
                                                          const ClientOrigin &origin);

  // Operator calls: host device token or loopback caller.
  [[nodiscard]] AuthResult<std::vector<devices::PendingRequest>>
  list_pending(const std::string &token, const ClientOrigin &origin);
  [[nodiscard]] AuthResult<devices::PendingRequest> approve(const std::string &token,
                                                            const ClientOrigin &origin,
                                                            const std::string &request_id);
  [[nodiscard]] AuthResult<devices::PendingRequest> deny(const std::string &token,
                                                         const ClientOrigin &origin,
                                                         const std::string &request_id);

  [[nodiscard]] AuthResult<std::vector<devices::DeviceRecord>>
  admin_list_devices(const std::string &token, const ClientOrigin &origin);
  [[nodiscard]] AuthResult<void> admin_revoke(const std::string &token, const ClientOrigin &origin,
                                              const std::string &target_device_id);
  [[nodiscard]] AuthResult<devices::DeviceRecord> admin_rename(const std::string &token,
                                                               const ClientOrigin &origin,
                                                               const std::string &target_device_id,
                                                               const std::string &name);
  /// NotFound when `keep_device_id` is not registered; nothing is removed then.
  [[nodiscard]] AuthResult<std::size_t> admin_revoke_all_except(const std::string &token,
                                                                const ClientOrigin &origin,
                                                                const std::string &keep_device_id);
  [[nodiscard]] AuthResult<std::string> admin_access_code(const std::string &token,
                                                          const ClientOrigin &origin);
  /// Replaces the signing secret and returns the new pairing code. Every issued token
  /// stops verifying.
  [[nodiscard]] AuthResult<std::string> admin_rotate_secret(const std::string &token,
                                                            const ClientOrigin &origin);

private:
  [[nodiscard]] AuthResult<devices::DeviceRecord> authenticate(const std::string &token,
                                                               const ClientOrigin &origin,
                                                               std::string_view action);
  [[nodiscard]] AuthResult<void> authorize_operator(const std::string &token,
                                                    const ClientOrigin &origin,
                                                    std::string_view action);
  [[nodiscard]] Session mint_session(const devices::DeviceDescriptor &device,
                                     const ClientOrigin &origin, bool is_host,
                                     std::string_view method);

  devices::DeviceStore &store_;
  devices::PendingRequestWorkflow &workflow_;
};

} // namespace pairgate::auth
