#pragma once

#include "pairgate/common/result.hpp"
#include "pairgate/devices/device.hpp"
#include "pairgate/security/token.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pairgate::devices {

constexpr std::int64_t DEFAULT_TOKEN_TTL_SECONDS = 365LL * 24 * 60 * 60;

/// Store-level token outcome: codec result plus the registry checks.
enum class TokenCheckStatus { Valid, Expired, BadSignature, Malformed, RevokedOrUnknownSubject };

struct TokenCheck {
  TokenCheckStatus status = TokenCheckStatus::Malformed;
  std::optional<std::string> device_id;

  [[nodiscard]] bool valid() const { return status == TokenCheckStatus::Valid; }
};

[[nodiscard]] std::string_view token_check_name(TokenCheckStatus status);

/// Partial update applied by DeviceStore::update_device. Unset fields are kept.
struct DeviceUpdate {
  std::optional<std::string> name;
  std::optional<std::string> platform;
  std::optional<std::string> browser;
  std::optional<std::string> ip;
};

/// Transition applied atomically by DeviceStore::resolve_request.
struct RequestResolution {
  RequestStatus status = RequestStatus::Denied;
  std::int64_t resolved_at = 0;
  // Requests created at or before this instant are treated as expired.
  std::int64_t expired_at_or_before = 0;
  std::optional<DeviceRecord> device;
  std::optional<std::string> token;
};

/// Persistent registry of devices, pending requests, revoked tokens and the signing
/// secret. The whole snapshot is rewritten on every mutation.
class DeviceStore {
public:
  explicit DeviceStore(std::filesystem::path path,
                       std::int64_t token_ttl_seconds = DEFAULT_TOKEN_TTL_SECONDS);

  DeviceStore(const DeviceStore &) = delete;
  DeviceStore &operator=(const DeviceStore &) = delete;

  /// Builds a record with a fresh id and current timestamps and persists it.
  [[nodiscard]] DeviceRecord create_device(const DeviceDescriptor &descriptor,
                                           const std::string &ip, bool is_host);
  [[nodiscard]] common::Status add_device(const DeviceRecord &device);
  [[nodiscard]] std::optional<DeviceRecord> get_device(const std::string &device_id) const;
  [[nodiscard]] std::optional<DeviceRecord> update_device(const std::string &device_id,
                                                          const DeviceUpdate &update);
  bool update_last_seen(const std::string &device_id, const std::string &ip);
  bool remove_device(const std::string &device_id);
  std::size_t revoke_all_except(const std::string &keep_device_id);

  /// Newest activity first; ties broken by creation time, newest first.
  [[nodiscard]] std::vector<DeviceRecord> list_devices() const;
  [[nodiscard]] std::size_t device_count() const;

  [[nodiscard]] std::string generate_token(const std::string &device_id) const;
  [[nodiscard]] TokenCheck verify_token(const std::string &token) const;
  [[nodiscard]] TokenCheck verify_token(const std::string &token, std::int64_t now_seconds) const;
  void revoke_token(const std::string &token);
  [[nodiscard]] bool is_token_revoked(const std::string &token) const;

  [[nodiscard]] std::string access_code() const;
  [[nodiscard]] std::string secret() const;
  /// New secret; every previously issued token stops verifying.
  void rotate_secret();

  [[nodiscard]] common::Status add_request(const PendingRequest &request);
  [[nodiscard]] std::optional<PendingRequest> get_request(const std::string &request_id) const;
  [[nodiscard]] std::vector<PendingRequest> all_requests() const;
  /// Moves a still-pending, unexpired request to `resolution.status`, inserting the
  /// minted device in the same write. Returns nullopt when no transition happened.
  [[nodiscard]] std::optional<PendingRequest> resolve_request(const std::string &request_id,
                                                              const RequestResolution &resolution);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::int64_t token_ttl_seconds() const { return token_ttl_seconds_; }

private:
  void load();
  [[nodiscard]] common::Status parse_snapshot(const std::string &text);
  [[nodiscard]] std::string render_snapshot() const;
  void reset_locked();
  void persist_locked();

  std::filesystem::path path_;
  std::int64_t token_ttl_seconds_;
  mutable std::mutex mutex_;
  std::map<std::string, DeviceRecord> devices_;
  std::map<std::string, PendingRequest> requests_;
  std::set<std::string> revoked_tokens_;
  std::string secret_;
};

} // namespace pairgate::devices
