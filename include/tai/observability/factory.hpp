#pragma once

#include "tai/config/schema.hpp"
#include "tai/observability/observer.hpp"

#include <memory>

namespace tai::observability {

/// Backend names: "none"/"noop", "log", or a comma-separated list of them.
/// Quiet names and lists build an ObserverSet; any other single name logs.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);
/// Uses `[observability] backend`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tai::observability
