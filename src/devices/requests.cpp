#include "pairgate/devices/requests.hpp"

#include "pairgate/common/time.hpp"
#include "pairgate/security/crypto.hpp"

#include <algorithm>

namespace pairgate::devices {

PendingRequestWorkflow::PendingRequestWorkflow(DeviceStore &store, const std::int64_t window_ms)
    : store_(store), window_ms_(window_ms) {}

common::Result<PendingRequest> PendingRequestWorkflow::create(const DeviceDescriptor &device,
                                                              const std::string &ip) {
  return create(device, ip, common::now_unix_ms());
}

common::Result<PendingRequest> PendingRequestWorkflow::create(const DeviceDescriptor &device,
                                                              const std::string &ip,
                                                              const std::int64_t now_ms) {
  PendingRequest request{.id = security::random_id(),
                         .device = device,
                         .ip = ip,
                         .status = RequestStatus::Pending,
                         .created_at = now_ms};
  const auto added = store_.add_request(request);
  if (!added.ok()) {
    return common::Result<PendingRequest>::failure(added.error());
  }
  return common::Result<PendingRequest>::success(std::move(request));
}

bool PendingRequestWorkflow::is_expired(const PendingRequest &request,
                                        const std::int64_t now_ms) const {
  return now_ms - request.created_at >= window_ms_;
}

std::vector<PendingRequest> PendingRequestWorkflow::list() const {
  return list(common::now_unix_ms());
}

std::vector<PendingRequest> PendingRequestWorkflow::list(const std::int64_t now_ms) const {
  auto requests = store_.all_requests();
  std::erase_if(requests, [&](const PendingRequest &request) {
    return request.status != RequestStatus::Pending || is_expired(request, now_ms);
  });
  std::sort(requests.begin(), requests.end(), [](const PendingRequest &a, const PendingRequest &b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.id < b.id;
  });
  return requests;
}

std::optional<PendingRequest> PendingRequestWorkflow::approve(const std::string &request_id) {
  return approve(request_id, common::now_unix_ms());
}

std::optional<PendingRequest> PendingRequestWorkflow::approve(const std::string &request_id,
                                                              const std::int64_t now_ms) {
  return resolve(request_id, RequestStatus::Approved, now_ms);
}

std::optional<PendingRequest> PendingRequestWorkflow::deny(const std::string &request_id) {
  return deny(request_id, common::now_unix_ms());
}

std::optional<PendingRequest> PendingRequestWorkflow::deny(const std::string &request_id,
                                                           const std::int64_t now_ms) {
  return resolve(request_id, RequestStatus::Denied, now_ms);
}

std::optional<PendingRequest> PendingRequestWorkflow::resolve(const std::string &request_id,
                                                              const RequestStatus status,
                                                              const std::int64_t now_ms) {
  const auto current = store_.get_request(request_id);
  if (!current.has_value() || current->status != RequestStatus::Pending ||
      is_expired(*current, now_ms)) {
    return std::nullopt;
  }

  RequestResolution resolution{.status = status,
                               .resolved_at = now_ms,
                               .expired_at_or_before = now_ms - window_ms_};
  if (status == RequestStatus::Approved) {
    DeviceRecord device{.id = security::random_id(),
                        .name = current->device.name,
                        .platform = current->device.platform,
                        .browser = current->device.browser,
                        .created_at = now_ms,
                        .last_seen_at = now_ms,
                        .ip = current->ip,
                        .is_host = false};
    resolution.token = store_.generate_token(device.id);
    resolution.device = std::move(device);
  }
  // the store re-checks pending under its lock, so a racing second call gets nullopt
  return store_.resolve_request(request_id, resolution);
}

std::optional<PendingRequest> PendingRequestWorkflow::status(const std::string &request_id) const {
  return status(request_id, common::now_unix_ms());
}

std::optional<PendingRequest> PendingRequestWorkflow::status(const std::string &request_id,
                                                             const std::int64_t now_ms) const {
  auto request = store_.get_request(request_id);
  if (!request.has_value()) {
    return std::nullopt;
  }
  if (request->status == RequestStatus::Pending && is_expired(*request, now_ms)) {
    request->status = RequestStatus::Expired;
  }
  return request;
}

} // namespace pairgate::devices
