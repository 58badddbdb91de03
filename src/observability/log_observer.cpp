#include "tai/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace tai::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  const auto log_line = [this](const std::string &level, const std::string &message) {
    out_ << "[" << level << "] " << message << "\n";
  };
  std::visit(
      [&log_line](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, TurnStartEvent>) {
          log_line("INFO", "turn.start provider=" + evt.provider + " model=" + evt.model);
        } else if constexpr (std::is_same_v<T, TurnEndEvent>) {
          log_line("INFO", "turn.end duration_ms=" + std::to_string(evt.duration.count()) +
                               " iterations=" + std::to_string(evt.iterations) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ModelRequestEvent>) {
          log_line("DEBUG", "model.request provider=" + evt.provider +
                                " latency_ms=" + std::to_string(evt.latency.count()) +
                                " tool_calls=" + std::to_string(evt.tool_calls) +
                                " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line("INFO", "tool.call name=" + evt.tool +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, HistoryWriteEvent>) {
          log_line("DEBUG", "history.write entries=" + std::to_string(evt.entries));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          out_ << "[DEBUG] metric.request_latency_ms=" << m.latency.count() << "\n";
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          out_ << "[DEBUG] metric.tokens_used=" << m.tokens << "\n";
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace tai::observability
