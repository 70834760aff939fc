#pragma once

#include "pairgate/common/result.hpp"
#include "pairgate/devices/store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pairgate::devices {

constexpr std::int64_t DEFAULT_REQUEST_WINDOW_MS = 5 * 60 * 1000;

/// Operator approval flow for remote pairing attempts.
///
///   pending --approve()--> approved   (mints one device and one token)
///   pending --deny()-----> denied
///   pending --age >= window--> expired (computed on read, never stored)
class PendingRequestWorkflow {
public:
  explicit PendingRequestWorkflow(DeviceStore &store,
                                  std::int64_t window_ms = DEFAULT_REQUEST_WINDOW_MS);

  [[nodiscard]] common::Result<PendingRequest> create(const DeviceDescriptor &device,
                                                      const std::string &ip);
  [[nodiscard]] common::Result<PendingRequest> create(const DeviceDescriptor &device,
                                                      const std::string &ip, std::int64_t now_ms);

  /// Live pending requests, oldest first.
  [[nodiscard]] std::vector<PendingRequest> list() const;
  [[nodiscard]] std::vector<PendingRequest> list(std::int64_t now_ms) const;

  [[nodiscard]] std::optional<PendingRequest> approve(const std::string &request_id);
  [[nodiscard]] std::optional<PendingRequest> approve(const std::string &request_id,
                                                      std::int64_t now_ms);
  [[nodiscard]] std::optional<PendingRequest> deny(const std::string &request_id);
  [[nodiscard]] std::optional<PendingRequest> deny(const std::string &request_id,
                                                   std::int64_t now_ms);

  /// Request with its effective status (a stale pending entry reads as expired).
  [[nodiscard]] std::optional<PendingRequest> status(const std::string &request_id) const;
  [[nodiscard]] std::optional<PendingRequest> status(const std::string &request_id,
                                                     std::int64_t now_ms) const;

  [[nodiscard]] bool is_expired(const PendingRequest &request, std::int64_t now_ms) const;
  [[nodiscard]] std::int64_t window_ms() const { return window_ms_; }

private:
  [[nodiscard]] std::optional<PendingRequest> resolve(const std::string &request_id,
                                                      RequestStatus status, std::int64_t now_ms);

  DeviceStore &store_;
  std::int64_t window_ms_;
};

} // namespace pairgate::devices
