#include "tai/observability/observer_set.hpp"

#include <algorithm>

namespace tai::observability {

bool ObserverSet::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  const auto same_name = [&](const std::unique_ptr<IObserver> &existing) {
    return existing->name() == observer->name();
  };
  if (std::any_of(observers_.begin(), observers_.end(), same_name)) {
    return false;
  }
  name_ = observers_.empty() ? std::string(observer->name())
                             : name_ + "+" + std::string(observer->name());
  observers_.push_back(std::move(observer));
  return true;
}

void ObserverSet::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void ObserverSet::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void ObserverSet::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace tai::observability
