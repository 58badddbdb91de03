#include "tai/observability/global.hpp"

#include <mutex>

namespace tai::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Dispatch holds the lock so a concurrent set_global_observer cannot destroy
// the observer mid-call.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_turn_start(const std::string &provider, const std::string &model) {
  record_event(TurnStartEvent{.provider = provider, .model = model});
}

void record_turn_end(const std::chrono::milliseconds duration, const std::uint32_t iterations,
                     const bool success) {
  record_event(TurnEndEvent{.duration = duration, .iterations = iterations, .success = success});
}

void record_model_request(const std::string &provider, const std::chrono::milliseconds latency,
                          const std::size_t tool_calls, const bool success) {
  record_event(ModelRequestEvent{
      .provider = provider, .latency = latency, .tool_calls = tool_calls, .success = success});
  record_metric(RequestLatencyMetric{.latency = latency});
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_history_write(const std::size_t entries) {
  record_event(HistoryWriteEvent{.entries = entries});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tai::observability
