#include "tai/providers/compatible.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace tai::providers {

namespace {

ProviderError invalid(const std::string &message) {
  return ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = message};
}

void write_message(std::ostringstream &body, const ChatMessage &message, bool &first) {
  const auto separator = [&]() {
    if (!first) {
      body << ',';
    }
    first = false;
  };

  // Results travel as one `tool` message per call.
  if (!message.tool_results.empty()) {
    for (const auto &result : message.tool_results) {
      separator();
      body << "{\"role\":\"tool\",\"tool_call_id\":" << common::json_quote(result.id)
           << ",\"content\":" << common::json_quote(result.payload) << "}";
    }
    return;
  }

  separator();
  body << "{\"role\":\"" << role_name(message.role) << "\",\"content\":";
  if (message.role == Role::Assistant && !message.tool_calls.empty() && message.content.empty()) {
    body << "null";
  } else {
    body << common::json_quote(message.content);
  }
  if (!message.tool_calls.empty()) {
    body << ",\"tool_calls\":[";
    for (std::size_t i = 0; i < message.tool_calls.size(); ++i) {
      const auto &call = message.tool_calls[i];
      if (i > 0) {
        body << ',';
      }
      body << "{\"id\":" << common::json_quote(call.id)
           << ",\"type\":\"function\",\"function\":{\"name\":" << common::json_quote(call.name)
           << ",\"arguments\":" << common::json_quote(normalize_arguments(call.arguments))
           << "}}";
    }
    body << "]";
  }
  body << "}";
}

common::Result<tools::ToolCall> parse_tool_call(const std::string &raw, const std::size_t index) {
  using ResultT = common::Result<tools::ToolCall>;
  auto fields = common::json_parse_object(raw);
  if (!fields.ok()) {
    return ResultT::failure("tool_calls[" + std::to_string(index) + "] is not an object");
  }
  const auto function_it = fields.value().find("function");
  if (function_it == fields.value().end()) {
    return ResultT::failure("tool_calls[" + std::to_string(index) + "].function missing");
  }
  auto function = common::json_parse_object(function_it->second);
  if (!function.ok()) {
    return ResultT::failure("tool_calls[" + std::to_string(index) + "].function is not an object");
  }

  tools::ToolCall call;
  call.id = common::json_field_string(fields.value(), "id");
  if (call.id.empty()) {
    call.id = "call_" + std::to_string(index);
  }
  call.name = common::json_field_string(function.value(), "name");
  if (call.name.empty()) {
    return ResultT::failure("tool_calls[" + std::to_string(index) + "] has no function name");
  }
  // Some servers send the arguments as an object rather than an encoded string.
  const auto args_it = function.value().find("arguments");
  if (args_it != function.value().end()) {
    call.arguments = common::json_is_string(args_it->second)
                         ? common::json_field_string(function.value(), "arguments")
                         : args_it->second;
  }
  return ResultT::success(std::move(call));
}

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<common::HttpClient> http_client,
                                       const bool require_api_key, const std::uint64_t timeout_ms)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

bool CompatibleProvider::omits_sampling(const std::string &model) const {
  return name_ == "openai" && common::starts_with(common::to_lower(model), "gpt-5");
}

std::string CompatibleProvider::build_body(const ChatRequest &request) const {
  std::ostringstream body;
  body << "{\"model\":" << common::json_quote(request.model) << ",\"messages\":[";
  bool first = true;
  for (const auto &message : request.messages) {
    write_message(body, message, first);
  }
  body << "]";

  if (!request.tools.empty()) {
    body << ",\"tools\":[";
    for (std::size_t i = 0; i < request.tools.size(); ++i) {
      const auto &tool = request.tools[i];
      if (i > 0) {
        body << ',';
      }
      body << "{\"type\":\"function\",\"function\":{\"name\":" << common::json_quote(tool.name)
           << ",\"description\":" << common::json_quote(tool.description)
           << ",\"parameters\":" << tool.parameters_json() << "}}";
    }
    body << "],\"tool_choice\":" << (request.allow_tool_calls ? "\"auto\"" : "\"none\"");
  }

  if (!omits_sampling(request.model)) {
    if (request.temperature.has_value()) {
      body << ",\"temperature\":" << *request.temperature;
    }
    if (request.max_tokens.has_value()) {
      body << ",\"max_tokens\":" << *request.max_tokens;
    }
  }
  body << ",\"stream\":false}";
  return body.str();
}

common::Result<ChatResponse> CompatibleProvider::parse_response(const std::string &body) {
  auto root = common::json_parse_object(body);
  if (!root.ok()) {
    return provider_failure(invalid("response is not a JSON object: " + root.error()));
  }
  const auto choices_it = root.value().find("choices");
  if (choices_it == root.value().end()) {
    return provider_failure(invalid("choices field missing"));
  }
  auto choices = common::json_parse_array(choices_it->second);
  if (!choices.ok() || choices.value().empty()) {
    return provider_failure(invalid("choices is empty"));
  }
  auto choice = common::json_parse_object(choices.value().front());
  if (!choice.ok()) {
    return provider_failure(invalid("choices[0] is not an object"));
  }
  const auto message_it = choice.value().find("message");
  if (message_it == choice.value().end()) {
    return provider_failure(invalid("choices[0].message missing"));
  }
  auto message = common::json_parse_object(message_it->second);
  if (!message.ok()) {
    return provider_failure(invalid("choices[0].message is not an object"));
  }

  ChatResponse response;
  response.content = common::json_field_string(message.value(), "content");
  const auto calls_it = message.value().find("tool_calls");
  if (calls_it != message.value().end() && !common::json_is_null(calls_it->second)) {
    auto calls = common::json_parse_array(calls_it->second);
    if (!calls.ok()) {
      return provider_failure(invalid("tool_calls is not an array"));
    }
    for (std::size_t i = 0; i < calls.value().size(); ++i) {
      auto call = parse_tool_call(calls.value()[i], i);
      if (!call.ok()) {
        return provider_failure(invalid(call.error()));
      }
      response.tool_calls.push_back(std::move(call.value()));
    }
  }

  const auto usage_it = root.value().find("usage");
  if (usage_it != root.value().end()) {
    if (auto usage = common::json_parse_object(usage_it->second); usage.ok()) {
      const auto number = [&](const std::string &key) -> std::uint64_t {
        const auto it = usage.value().find(key);
        if (it == usage.value().end() || it->second.empty() ||
            !std::isdigit(static_cast<unsigned char>(it->second.front()))) {
          return 0;
        }
        return std::strtoull(it->second.c_str(), nullptr, 10);
      };
      response.usage.input_tokens = number("prompt_tokens");
      response.usage.output_tokens = number("completion_tokens");
    }
  }
  return common::Result<ChatResponse>::success(std::move(response));
}

common::Result<ChatResponse> CompatibleProvider::chat(const ChatRequest &request) {
  if (require_api_key_ && api_key_.empty()) {
    return provider_failure(
        {.code = ProviderErrorCode::AuthError, .message = "missing API key for " + name_});
  }

  common::HttpRequest http_request{.method = "POST",
                                   .url = base_url_ + "/chat/completions",
                                   .headers = {{"Content-Type", "application/json"}},
                                   .body = build_body(request),
                                   .timeout_ms = timeout_ms_};
  if (!api_key_.empty()) {
    http_request.headers.emplace_back("Authorization", "Bearer " + api_key_);
  }

  const auto response = http_client_->send(http_request);
  if (auto error = classify_response(response); error.has_value()) {
    return provider_failure(*error);
  }
  return parse_response(response.body);
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace tai::providers
