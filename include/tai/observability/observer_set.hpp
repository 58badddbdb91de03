#pragma once

#include "tai/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tai::observability {

/// Fans every event out to its backends. A backend whose name is already in
/// the set is dropped, so "log,log" writes each line once. An empty set is
/// the quiet "none" backend.
class ObserverSet final : public IObserver {
public:
  /// Returns false when the backend was null or a duplicate.
  bool add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] bool empty() const { return observers_.empty(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  /// Member names joined with '+', or "none".
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string name_ = "none";
};

} // namespace tai::observability
