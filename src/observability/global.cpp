#include "pairgate/observability/global.hpp"

#include <mutex>

namespace pairgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_device_authorized(const std::string &device_id, const std::string &method,
                              const std::string &ip) {
  record_event(DeviceAuthorizedEvent{.device_id = device_id, .method = method, .ip = ip});
}

void record_device_revoked(const std::string &device_id, const std::string &reason) {
  record_event(DeviceRevokedEvent{.device_id = device_id, .reason = reason});
}

void record_request_created(const std::string &request_id, const std::string &ip) {
  record_event(AccessRequestCreatedEvent{.request_id = request_id, .ip = ip});
}

void record_request_resolved(const std::string &request_id, const std::string &status) {
  record_event(AccessRequestResolvedEvent{.request_id = request_id, .status = status});
}

void record_auth_failure(const std::string &route, const std::string &reason,
                         const std::string &ip) {
  record_event(AuthFailureEvent{.route = route, .reason = reason, .ip = ip});
}

void record_tunnel_status(const std::string &status, const std::string &url) {
  record_event(TunnelStatusEvent{.status = status, .url = url});
}

void record_request_latency(const std::string &route, const std::chrono::milliseconds latency) {
  record_metric(RequestLatencyMetric{.route = route, .latency = latency});
}

void record_device_count(const std::uint64_t count) {
  record_metric(DeviceCountMetric{.count = count});
}

void record_pending_requests(const std::uint64_t count) {
  record_metric(PendingRequestsMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace pairgate::observability
