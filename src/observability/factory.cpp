#include "tai/observability/factory.hpp"

#include "tai/common/fs.hpp"
#include "tai/observability/log_observer.hpp"
#include "tai/observability/observer_set.hpp"

#include <sstream>

namespace tai::observability {

namespace {

bool is_quiet(const std::string &name) { return name.empty() || name == "none" || name == "noop"; }

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend_name) {
  const std::string backend = common::to_lower(common::trim(backend_name));
  if (is_quiet(backend)) {
    return std::make_unique<ObserverSet>();
  }
  if (backend.find(',') == std::string::npos) {
    // Unknown names still log so a typo does not silence diagnostics.
    return std::make_unique<LogObserver>();
  }

  auto set = std::make_unique<ObserverSet>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (name == "log") {
      set->add(std::make_unique<LogObserver>());
    }
  }
  return set;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config.observability.backend);
}

} // namespace tai::observability
