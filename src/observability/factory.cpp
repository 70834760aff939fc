#include "pairgate/observability/factory.hpp"

#include "pairgate/common/fs.hpp"
#include "pairgate/observability/log_observer.hpp"
#include "pairgate/observability/multi_observer.hpp"
#include "pairgate/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace pairgate::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  // "log" and anything unrecognised; validate_config reports the latter
  return std::make_unique<LogObserver>();
}

std::vector<std::string> backend_list(const std::string &selection) {
  std::vector<std::string> names;
  std::stringstream stream(selection);
  std::string part;
  while (std::getline(stream, part, ',')) {
    names.push_back(common::trim(part));
  }
  return names;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string selection = common::to_lower(common::trim(config.observability.backend));
  if (selection.find(',') == std::string::npos) {
    return make_backend(selection);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : backend_list(selection)) {
    if (!name.empty()) {
      (void)multi->add(make_backend(name));
    }
  }
  return multi;
}

} // namespace pairgate::observability
