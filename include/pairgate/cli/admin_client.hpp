#pragma once

#include "pairgate/auth/gateway.hpp"
#include "pairgate/common/http_client.hpp"
#include "pairgate/common/result.hpp"
#include "pairgate/config/schema.hpp"
#include "pairgate/devices/device.hpp"
#include "pairgate/devices/requests.hpp"
#include "pairgate/devices/store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pairgate::cli {

/// Registry administration behind the `devices`, `requests`, `code` and `rotate-secret`
/// commands. Errors are messages ready to print.
class AdminClient {
public:
  virtual ~AdminClient() = default;

  [[nodiscard]] virtual common::Result<std::vector<devices::DeviceRecord>> list_devices() = 0;
  [[nodiscard]] virtual common::Status revoke_device(const std::string &device_id) = 0;
  [[nodiscard]] virtual common::Result<devices::DeviceRecord>
  rename_device(const std::string &device_id, const std::string &name) = 0;
  [[nodiscard]] virtual common::Result<std::size_t>
  revoke_others(const std::string &keep_device_id) = 0;

  [[nodiscard]] virtual common::Result<std::vector<devices::PendingRequest>> list_requests() = 0;
  [[nodiscard]] virtual common::Result<devices::PendingRequest>
  resolve_request(const std::string &request_id, bool approve) = 0;

  [[nodiscard]] virtual common::Result<std::string> access_code() = 0;
  /// Returns the pairing code derived from the new secret.
  [[nodiscard]] virtual common::Result<std::string> rotate_secret() = 0;

  /// "store" or "gateway".
  [[nodiscard]] virtual std::string_view mode() const = 0;
};

/// Opens the registry file itself. Only used while no gateway owns the store.
class LocalAdminClient final : public AdminClient {
public:
  explicit LocalAdminClient(const config::Config &config);

  [[nodiscard]] common::Result<std::vector<devices::DeviceRecord>> list_devices() override;
  [[nodiscard]] common::Status revoke_device(const std::string &device_id) override;
  [[nodiscard]] common::Result<devices::DeviceRecord>
  rename_device(const std::string &device_id, const std::string &name) override;
  [[nodiscard]] common::Result<std::size_t>
  revoke_others(const std::string &keep_device_id) override;
  [[nodiscard]] common::Result<std::vector<devices::PendingRequest>> list_requests() override;
  [[nodiscard]] common::Result<devices::PendingRequest>
  resolve_request(const std::string &request_id, bool approve) override;
  [[nodiscard]] common::Result<std::string> access_code() override;
  [[nodiscard]] common::Result<std::string> rotate_secret() override;
  [[nodiscard]] std::string_view mode() const override { return "store"; }

private:
  devices::DeviceStore store_;
  devices::PendingRequestWorkflow workflow_;
  auth::AuthGateway auth_;
  auth::ClientOrigin origin_;
};

/// Sends the same operations to the admin routes of a gateway listening on loopback.
class RemoteAdminClient final : public AdminClient {
public:
  RemoteAdminClient(std::unique_ptr<common::HttpClient> http, std::uint16_t port);

  [[nodiscard]] common::Result<std::vector<devices::DeviceRecord>> list_devices() override;
  [[nodiscard]] common::Status revoke_device(const std::string &device_id) override;
  [[nodiscard]] common::Result<devices::DeviceRecord>
  rename_device(const std::string &device_id, const std::string &name) override;
  [[nodiscard]] common::Result<std::size_t>
  revoke_others(const std::string &keep_device_id) override;
  [[nodiscard]] common::Result<std::vector<devices::PendingRequest>> list_requests() override;
  [[nodiscard]] common::Result<devices::PendingRequest>
  resolve_request(const std::string &request_id, bool approve) override;
  [[nodiscard]] common::Result<std::string> access_code() override;
  [[nodiscard]] common::Result<std::string> rotate_secret() override;
  [[nodiscard]] std::string_view mode() const override { return "gateway"; }

private:
  [[nodiscard]] common::HttpClientResponse call(const std::string &method, const std::string &path,
                                                const std::optional<std::string> &body = {});

  std::unique_ptr<common::HttpClient> http_;
  std::uint16_t port_;
};

/// Remote client when a live gateway holds the store lock, local client otherwise.
[[nodiscard]] std::unique_ptr<AdminClient> open_admin_client(const config::Config &config);

} // namespace pairgate::cli
