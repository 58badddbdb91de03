#include "tai/agent/engine.hpp"

#include "tai/common/time.hpp"
#include "tai/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace tai::agent {

namespace {

constexpr const char *kShellToolName = "run_shell";

constexpr const char *kShellSteering =
    "Summarize the results of the terminal command succinctly and proceed with any next steps "
    "to complete the user's request. If the command output already satisfies the request, "
    "provide the final answer concisely.";

constexpr const char *kToolSteering =
    "Use the tool outputs above to answer the user directly. Provide a concise summary or the "
    "requested information. If more actions are needed, call a tool.";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

std::string_view engine_state_name(const EngineState state) {
  switch (state) {
  case EngineState::Idle:
    return "idle";
  case EngineState::AwaitingModel:
    return "awaiting_model";
  case EngineState::DispatchingTools:
    return "dispatching_tools";
  case EngineState::Done:
    return "done";
  }
  return "idle";
}

ConversationEngine::ConversationEngine(std::shared_ptr<providers::Provider> provider,
                                       const tools::ToolRegistry &registry, EngineOptions options,
                                       EngineCallbacks callbacks,
                                       std::shared_ptr<InteractionHistory> interaction_log)
    : provider_(std::move(provider)), registry_(registry), options_(std::move(options)),
      callbacks_(std::move(callbacks)), interaction_log_(std::move(interaction_log)) {}

std::string ConversationEngine::steering_message(const std::vector<tools::ToolCall> &calls) {
  const bool ran_shell = std::any_of(calls.begin(), calls.end(), [](const tools::ToolCall &call) {
    return call.name == kShellToolName;
  });
  return ran_shell ? kShellSteering : kToolSteering;
}

common::Result<providers::ChatResponse> ConversationEngine::query_model(const bool allow_tools) {
  state_ = EngineState::AwaitingModel;
  providers::ChatRequest request{
      .model = options_.model,
      .messages = history_,
      .tools = registry_.all_specs(),
      .allow_tool_calls = allow_tools,
      .temperature = options_.temperature,
      .max_tokens = options_.max_tokens,
  };

  const auto started = std::chrono::steady_clock::now();
  auto response = provider_->chat(request);
  observability::record_model_request(options_.provider_name, elapsed_since(started),
                                      response.ok() ? response.value().tool_calls.size() : 0,
                                      response.ok());
  if (response.ok()) {
    const auto &usage = response.value().usage;
    if (usage.input_tokens + usage.output_tokens > 0) {
      observability::record_metric(
          observability::TokensUsedMetric{.tokens = usage.input_tokens + usage.output_tokens});
    }
  }
  return response;
}

void ConversationEngine::dispatch_calls(const providers::ChatResponse &response,
                                        TurnResult &turn) {
  state_ = EngineState::DispatchingTools;
  history_.push_back(providers::ChatMessage{.role = providers::Role::Assistant,
                                            .content = response.content,
                                            .tool_calls = response.tool_calls,
                                            .tool_results = {}});

  std::vector<tools::ToolResult> results;
  results.reserve(response.tool_calls.size());
  for (const auto &call : response.tool_calls) {
    if (callbacks_.on_tool_call) {
      callbacks_.on_tool_call(call);
    }
    auto result = registry_.dispatch(call);
    if (callbacks_.on_tool_result) {
      callbacks_.on_tool_result(result);
    }
    results.push_back(std::move(result));
  }

  turn.tool_results.insert(turn.tool_results.end(), results.begin(), results.end());
  history_.push_back(providers::ChatMessage{.role = providers::Role::User,
                                            .content = "",
                                            .tool_calls = {},
                                            .tool_results = std::move(results)});
  history_.push_back(providers::ChatMessage{.role = providers::Role::User,
                                            .content = steering_message(response.tool_calls),
                                            .tool_calls = {},
                                            .tool_results = {}});
}

void ConversationEngine::remember(const std::string &user_input, const std::string &answer) {
  if (!interaction_log_) {
    return;
  }
  const auto status = interaction_log_->add_entry(user_input, answer, common::now_seconds());
  if (!status.ok()) {
    observability::record_error("history", status.error());
  }
}

common::Result<TurnResult> ConversationEngine::run_turn(const std::string &system_prompt,
                                                        const std::string &user_input) {
  const auto started = std::chrono::steady_clock::now();
  observability::record_turn_start(options_.provider_name, options_.model);

  if (history_.empty()) {
    history_.push_back(
        providers::ChatMessage{.role = providers::Role::System, .content = system_prompt});
  }
  history_.push_back(providers::ChatMessage{.role = providers::Role::User, .content = user_input});

  TurnResult turn;
  std::uint32_t rounds = 0;
  while (true) {
    const bool allow_tools = rounds < options_.max_tool_iterations;
    auto response = query_model(allow_tools);
    ++turn.iterations;
    if (!response.ok()) {
      state_ = EngineState::Done;
      observability::record_turn_end(elapsed_since(started), turn.iterations, false);
      return common::Result<TurnResult>::failure(response.kind(), response.error());
    }
    turn.usage.input_tokens += response.value().usage.input_tokens;
    turn.usage.output_tokens += response.value().usage.output_tokens;

    if (!response.value().has_tool_calls()) {
      turn.text = response.value().content;
      history_.push_back(
          providers::ChatMessage{.role = providers::Role::Assistant, .content = turn.text});
      state_ = EngineState::Done;
      remember(user_input, turn.text);
      observability::record_turn_end(elapsed_since(started), turn.iterations, true);
      return common::Result<TurnResult>::success(std::move(turn));
    }

    if (!allow_tools) {
      state_ = EngineState::Done;
      observability::record_turn_end(elapsed_since(started), turn.iterations, false);
      return common::Result<TurnResult>::failure(
          common::ErrorKind::Validation,
          "Model kept requesting tools after " + std::to_string(options_.max_tool_iterations) +
              " tool rounds");
    }

    dispatch_calls(response.value(), turn);
    ++rounds;
  }
}

} // namespace tai::agent
