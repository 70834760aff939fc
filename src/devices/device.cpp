#include "pairgate/devices/device.hpp"

#include "pairgate/common/json_util.hpp"

#include <sstream>

namespace pairgate::devices {

namespace {

using common::json_string;

std::string field_or_empty(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? std::string() : it->second;
}

std::optional<std::int64_t> int_field(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return common::json_to_int64(it->second);
}

} // namespace

std::string_view request_status_name(const RequestStatus status) {
  switch (status) {
  case RequestStatus::Pending:
    return "pending";
  case RequestStatus::Approved:
    return "approved";
  case RequestStatus::Denied:
    return "denied";
  case RequestStatus::Expired:
    return "expired";
  }
  return "pending";
}

std::optional<RequestStatus> parse_request_status(const std::string_view name) {
  if (name == "pending") {
    return RequestStatus::Pending;
  }
  if (name == "approved") {
    return RequestStatus::Approved;
  }
  if (name == "denied") {
    return RequestStatus::Denied;
  }
  if (name == "expired") {
    return RequestStatus::Expired;
  }
  return std::nullopt;
}

std::string encode_descriptor_json(const DeviceDescriptor &descriptor) {
  return "{\"name\":" + json_string(descriptor.name) +
         ",\"platform\":" + json_string(descriptor.platform) +
         ",\"browser\":" + json_string(descriptor.browser) + "}";
}

DeviceDescriptor parse_descriptor_json(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  return DeviceDescriptor{.name = field_or_empty(fields, "name"),
                          .platform = field_or_empty(fields, "platform"),
                          .browser = field_or_empty(fields, "browser")};
}

std::string encode_device_json(const DeviceRecord &device) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << json_string(device.id) << ",";
  out << "\"name\":" << json_string(device.name) << ",";
  out << "\"platform\":" << json_string(device.platform) << ",";
  out << "\"browser\":" << json_string(device.browser) << ",";
  out << "\"createdAt\":" << device.created_at << ",";
  out << "\"lastSeenAt\":" << device.last_seen_at << ",";
  out << "\"ip\":" << json_string(device.ip) << ",";
  out << "\"isHost\":" << (device.is_host ? "true" : "false");
  out << "}";
  return out.str();
}

common::Result<DeviceRecord> parse_device_json(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<DeviceRecord>::failure("device entry is not an object");
  }
  const auto fields = common::json_parse_flat(json);
  DeviceRecord device;
  device.id = field_or_empty(fields, "id");
  if (device.id.empty()) {
    return common::Result<DeviceRecord>::failure("device id missing");
  }
  device.name = field_or_empty(fields, "name");
  device.platform = field_or_empty(fields, "platform");
  device.browser = field_or_empty(fields, "browser");
  device.ip = field_or_empty(fields, "ip");
  device.created_at = int_field(fields, "createdAt").value_or(0);
  device.last_seen_at = int_field(fields, "lastSeenAt").value_or(device.created_at);
  device.is_host = field_or_empty(fields, "isHost") == "true";
  return common::Result<DeviceRecord>::success(std::move(device));
}

std::string encode_request_json(const PendingRequest &request) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << json_string(request.id) << ",";
  out << "\"device\":" << encode_descriptor_json(request.device) << ",";
  out << "\"ip\":" << json_string(request.ip) << ",";
  out << "\"status\":" << json_string(std::string(request_status_name(request.status))) << ",";
  out << "\"createdAt\":" << request.created_at;
  if (request.resolved_at.has_value()) {
    out << ",\"resolvedAt\":" << *request.resolved_at;
  }
  if (request.device_id.has_value()) {
    out << ",\"deviceId\":" << json_string(*request.device_id);
  }
  if (request.token.has_value()) {
    out << ",\"token\":" << json_string(*request.token);
  }
  out << "}";
  return out.str();
}

common::Result<PendingRequest> parse_request_json(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<PendingRequest>::failure("request entry is not an object");
  }
  const auto fields = common::json_parse_flat(json);
  PendingRequest request;
  request.id = field_or_empty(fields, "id");
  if (request.id.empty()) {
    return common::Result<PendingRequest>::failure("request id missing");
  }
  const auto status = parse_request_status(field_or_empty(fields, "status"));
  if (!status.has_value()) {
    return common::Result<PendingRequest>::failure("request status invalid");
  }
  request.status = *status;
  request.device = parse_descriptor_json(field_or_empty(fields, "device"));
  request.ip = field_or_empty(fields, "ip");
  request.created_at = int_field(fields, "createdAt").value_or(0);
  request.resolved_at = int_field(fields, "resolvedAt");
  if (const auto device_id = field_or_empty(fields, "deviceId"); !device_id.empty()) {
    request.device_id = device_id;
  }
  if (const auto token = field_or_empty(fields, "token"); !token.empty()) {
    request.token = token;
  }
  return common::Result<PendingRequest>::success(std::move(request));
}

} // namespace pairgate::devices
