#include "pairgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace pairgate::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string or_dash(const std::string &value) { return value.empty() ? "-" : value; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DeviceAuthorizedEvent>) {
          log_line("INFO", "device.authorized id=" + evt.device_id + " method=" + evt.method +
                               " ip=" + or_dash(evt.ip));
        } else if constexpr (std::is_same_v<T, DeviceRevokedEvent>) {
          log_line("INFO", "device.revoked id=" + evt.device_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, AccessRequestCreatedEvent>) {
          log_line("INFO",
                   "request.created id=" + evt.request_id + " ip=" + or_dash(evt.ip));
        } else if constexpr (std::is_same_v<T, AccessRequestResolvedEvent>) {
          log_line("INFO", "request.resolved id=" + evt.request_id + " status=" + evt.status);
        } else if constexpr (std::is_same_v<T, AuthFailureEvent>) {
          log_line("WARN", "auth.failure route=" + evt.route + " reason=" + evt.reason +
                               " ip=" + or_dash(evt.ip));
        } else if constexpr (std::is_same_v<T, TunnelStatusEvent>) {
          log_line("INFO", "tunnel.status status=" + evt.status + " url=" + or_dash(evt.url));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()) +
                                " route=" + m.route);
        } else if constexpr (std::is_same_v<T, DeviceCountMetric>) {
          log_line("DEBUG", "metric.device_count=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, PendingRequestsMetric>) {
          log_line("DEBUG", "metric.pending_requests=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace pairgate::observability
