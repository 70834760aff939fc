#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace pairgate::observability {

struct DeviceAuthorizedEvent {
  std::string device_id;
  std::string method; // local, code, approval
  std::string ip;
};

struct DeviceRevokedEvent {
  std::string device_id;
  std::string reason;
};

struct AccessRequestCreatedEvent {
  std::string request_id;
  std::string ip;
};

struct AccessRequestResolvedEvent {
  std::string request_id;
  std::string status;
};

/// Reason stays server-side; clients only ever see "unauthorized".
struct AuthFailureEvent {
  std::string route;
  std::string reason;
  std::string ip;
};

struct TunnelStatusEvent {
  std::string status;
  std::string url;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DeviceAuthorizedEvent, DeviceRevokedEvent, AccessRequestCreatedEvent,
                 AccessRequestResolvedEvent, AuthFailureEvent, TunnelStatusEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string route;
  std::chrono::milliseconds latency{0};
};

struct DeviceCountMetric {
  std::uint64_t count = 0;
};

struct PendingRequestsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, DeviceCountMetric, PendingRequestsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace pairgate::observability
