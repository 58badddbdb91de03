#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tai::observability {

struct TurnStartEvent {
  std::string provider;
  std::string model;
};

struct TurnEndEvent {
  std::chrono::milliseconds duration{0};
  std::uint32_t iterations = 0;
  bool success = true;
};

struct ModelRequestEvent {
  std::string provider;
  std::chrono::milliseconds latency{0};
  std::size_t tool_calls = 0;
  bool success = true;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct HistoryWriteEvent {
  std::size_t entries = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<TurnStartEvent, TurnEndEvent, ModelRequestEvent, ToolCallEvent,
                                   HistoryWriteEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, TokensUsedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tai::observability
