#pragma once

#include "pairgate/config/schema.hpp"
#include "pairgate/observability/observer.hpp"

#include <memory>

namespace pairgate::observability {

/// Builds the observer named by `observability.backend` ("log", "none", or a comma list).
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace pairgate::observability
