#pragma once

#include "pairgate/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pairgate::observability {

/// Fans every event out to its children. At most one child per backend name, so a
/// list like "log,log" writes each line once.
class MultiObserver final : public IObserver {
public:
  /// Returns false when the observer is null or its backend is already attached.
  bool add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

  [[nodiscard]] std::size_t size() const { return children_.size(); }
  [[nodiscard]] std::vector<std::string> backend_names() const;

private:
  std::vector<std::unique_ptr<IObserver>> children_;
};

} // namespace pairgate::observability
