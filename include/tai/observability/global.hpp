#pragma once

#include "tai/observability/observer.hpp"

#include <memory>

namespace tai::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_turn_start(const std::string &provider, const std::string &model);
void record_turn_end(std::chrono::milliseconds duration, std::uint32_t iterations, bool success);
void record_model_request(const std::string &provider, std::chrono::milliseconds latency,
                          std::size_t tool_calls, bool success);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_history_write(std::size_t entries);
void record_error(const std::string &component, const std::string &message);

} // namespace tai::observability
