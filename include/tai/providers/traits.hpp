#pragma once

#include "tai/common/http.hpp"
#include "tai/common/result.hpp"
#include "tai/tools/tool.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tai::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

enum class Role {
  System,
  User,
  Assistant,
};

[[nodiscard]] std::string_view role_name(Role role);

/// One history entry. An Assistant message may carry the tool calls it issued;
/// a User message may carry the results of those calls instead of text.
struct ChatMessage {
  Role role = Role::User;
  std::string content;
  std::vector<tools::ToolCall> tool_calls;
  std::vector<tools::ToolResult> tool_results;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::vector<tools::ToolSpec> tools;
  /// When false the catalog is still sent (earlier tool rounds in the history
  /// refer to it) but the model is told not to call any tool.
  bool allow_tool_calls = true;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
};

struct Usage {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

struct ChatResponse {
  std::string content;
  std::vector<tools::ToolCall> tool_calls;
  Usage usage;

  [[nodiscard]] bool has_tool_calls() const { return !tool_calls.empty(); }
};

class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<ChatResponse> chat(const ChatRequest &request) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

/// Failure result of kind Provider carrying `error.to_string()`.
[[nodiscard]] common::Result<ChatResponse> provider_failure(const ProviderError &error);

/// Maps transport failures and non-2xx statuses to a ProviderError.
[[nodiscard]] std::optional<ProviderError> classify_response(const common::HttpResponse &response);

/// The raw text as a JSON object, or "{}" when it is empty or not an object.
[[nodiscard]] std::string normalize_arguments(const std::string &raw);

} // namespace tai::providers
