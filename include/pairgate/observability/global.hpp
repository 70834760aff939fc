#pragma once

#include "pairgate/observability/observer.hpp"

#include <memory>

namespace pairgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_device_authorized(const std::string &device_id, const std::string &method,
                              const std::string &ip);
void record_device_revoked(const std::string &device_id, const std::string &reason);
void record_request_created(const std::string &request_id, const std::string &ip);
void record_request_resolved(const std::string &request_id, const std::string &status);
void record_auth_failure(const std::string &route, const std::string &reason,
                         const std::string &ip);
void record_tunnel_status(const std::string &status, const std::string &url);
void record_request_latency(const std::string &route, std::chrono::milliseconds latency);
void record_device_count(std::uint64_t count);
void record_pending_requests(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace pairgate::observability
