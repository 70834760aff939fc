#include "pairgate/observability/multi_observer.hpp"

#include <algorithm>

namespace pairgate::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  const bool duplicate =
      std::any_of(children_.begin(), children_.end(), [&observer](const auto &child) {
        return child->name() == observer->name();
      });
  if (duplicate) {
    return false;
  }
  children_.push_back(std::move(observer));
  return true;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &child : children_) {
    child->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &child : children_) {
    child->record_metric(metric);
  }
}

void MultiObserver::flush() {
  std::for_each(children_.begin(), children_.end(), [](const auto &child) { child->flush(); });
}

std::vector<std::string> MultiObserver::backend_names() const {
  std::vector<std::string> names;
  names.reserve(children_.size());
  for (const auto &child : children_) {
    names.emplace_back(child->name());
  }
  return names;
}

} // namespace pairgate::observability
