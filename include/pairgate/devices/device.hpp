#pragma once

#include "pairgate/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pairgate::devices {

/// Client-supplied description of a device. Empty fields are filled from the User-Agent.
struct DeviceDescriptor {
  std::string name;
  std::string platform;
  std::string browser;
};

struct DeviceRecord {
  std::string id;
  std::string name;
  std::string platform;
  std::string browser;
  std::int64_t created_at = 0;   // unix ms
  std::int64_t last_seen_at = 0; // unix ms
  std::string ip;
  bool is_host = false;
};

enum class RequestStatus { Pending, Approved, Denied, Expired };

struct PendingRequest {
  std::string id;
  DeviceDescriptor device;
  std::string ip;
  RequestStatus status = RequestStatus::Pending;
  std::int64_t created_at = 0; // unix ms
  std::optional<std::int64_t> resolved_at;
  std::optional<std::string> device_id; // set once approved
  std::optional<std::string> token;     // set once approved
};

[[nodiscard]] std::string_view request_status_name(RequestStatus status);
[[nodiscard]] std::optional<RequestStatus> parse_request_status(std::string_view name);

[[nodiscard]] std::string encode_descriptor_json(const DeviceDescriptor &descriptor);
[[nodiscard]] DeviceDescriptor parse_descriptor_json(const std::string &json);

[[nodiscard]] std::string encode_device_json(const DeviceRecord &device);
[[nodiscard]] common::Result<DeviceRecord> parse_device_json(const std::string &json);

/// Includes token and deviceId only when present.
[[nodiscard]] std::string encode_request_json(const PendingRequest &request);
[[nodiscard]] common::Result<PendingRequest> parse_request_json(const std::string &json);

} // namespace pairgate::devices
