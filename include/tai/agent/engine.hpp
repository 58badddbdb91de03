#pragma once

#include "tai/agent/history.hpp"
#include "tai/common/result.hpp"
#include "tai/providers/traits.hpp"
#include "tai/tools/tool_registry.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tai::agent {

enum class EngineState {
  Idle,
  AwaitingModel,
  DispatchingTools,
  Done,
};

[[nodiscard]] std::string_view engine_state_name(EngineState state);

struct EngineOptions {
  std::string provider_name;
  std::string model;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
  /// Dispatch rounds per turn before the model is asked to answer without tools.
  std::uint32_t max_tool_iterations = 25;
};

struct EngineCallbacks {
  std::function<void(const tools::ToolCall &)> on_tool_call;
  std::function<void(const tools::ToolResult &)> on_tool_result;
};

struct TurnResult {
  std::string text;
  /// Model requests issued during the turn.
  std::uint32_t iterations = 0;
  std::vector<tools::ToolResult> tool_results;
  providers::Usage usage;
};

/// Drives one conversation: queries the model with the full history and the
/// tool catalog, dispatches requested calls strictly in order, and loops until
/// the model answers with text.
class ConversationEngine {
public:
  ConversationEngine(std::shared_ptr<providers::Provider> provider,
                     const tools::ToolRegistry &registry, EngineOptions options,
                     EngineCallbacks callbacks = {},
                     std::shared_ptr<InteractionHistory> interaction_log = nullptr);

  /// The system prompt is only used when the history is still empty.
  [[nodiscard]] common::Result<TurnResult> run_turn(const std::string &system_prompt,
                                                    const std::string &user_input);

  [[nodiscard]] const std::vector<providers::ChatMessage> &history() const { return history_; }
  [[nodiscard]] EngineState state() const { return state_; }

  /// Follow-up instruction appended after each round of tool results.
  [[nodiscard]] static std::string steering_message(const std::vector<tools::ToolCall> &calls);

private:
  [[nodiscard]] common::Result<providers::ChatResponse> query_model(bool allow_tools);
  void dispatch_calls(const providers::ChatResponse &response, TurnResult &turn);
  void remember(const std::string &user_input, const std::string &answer);

  std::shared_ptr<providers::Provider> provider_;
  const tools::ToolRegistry &registry_;
  EngineOptions options_;
  EngineCallbacks callbacks_;
  std::shared_ptr<InteractionHistory> interaction_log_;
  std::vector<providers::ChatMessage> history_;
  EngineState state_ = EngineState::Idle;
};

} // namespace tai::agent
