#include "tai/providers/anthropic.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace tai::providers {

namespace {

constexpr const char *kApiVersion = "2023-06-01";
constexpr std::uint32_t kDefaultMaxTokens = 4096;

ProviderError invalid(const std::string &message) {
  return ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = message};
}

struct Turn {
  Role role = Role::User;
  std::vector<std::string> blocks;
};

std::string text_block(const std::string &text) {
  return "{\"type\":\"text\",\"text\":" + common::json_quote(text) + "}";
}

std::vector<std::string> content_blocks(const ChatMessage &message) {
  std::vector<std::string> blocks;
  for (const auto &result : message.tool_results) {
    blocks.push_back("{\"type\":\"tool_result\",\"tool_use_id\":" + common::json_quote(result.id) +
                     ",\"content\":" + common::json_quote(result.payload) +
                     (result.success ? "" : ",\"is_error\":true") + "}");
  }
  if (!message.content.empty()) {
    blocks.push_back(text_block(message.content));
  }
  for (const auto &call : message.tool_calls) {
    blocks.push_back("{\"type\":\"tool_use\",\"id\":" + common::json_quote(call.id) +
                     ",\"name\":" + common::json_quote(call.name) +
                     ",\"input\":" + normalize_arguments(call.arguments) + "}");
  }
  return blocks;
}

std::uint64_t usage_number(const common::JsonFields &usage, const std::string &key) {
  const auto it = usage.find(key);
  if (it == usage.end() || it->second.empty() ||
      !std::isdigit(static_cast<unsigned char>(it->second.front()))) {
    return 0;
  }
  return std::strtoull(it->second.c_str(), nullptr, 10);
}

} // namespace

AnthropicProvider::AnthropicProvider(std::string api_key, std::string base_url,
                                     std::shared_ptr<common::HttpClient> http_client,
                                     const std::uint64_t timeout_ms)
    : api_key_(std::move(api_key)), base_url_(std::move(base_url)),
      http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string AnthropicProvider::messages_url() const {
  if (common::ends_with(base_url_, "/v1")) {
    return base_url_ + "/messages";
  }
  return base_url_ + "/v1/messages";
}

std::string AnthropicProvider::build_body(const ChatRequest &request) const {
  std::string system;
  std::vector<Turn> turns;
  for (const auto &message : request.messages) {
    if (message.role == Role::System) {
      if (!system.empty()) {
        system += "\n\n";
      }
      system += message.content;
      continue;
    }
    auto blocks = content_blocks(message);
    if (blocks.empty()) {
      continue;
    }
    // The API expects alternating roles; consecutive same-role messages merge.
    if (!turns.empty() && turns.back().role == message.role) {
      auto &target = turns.back().blocks;
      target.insert(target.end(), blocks.begin(), blocks.end());
      continue;
    }
    turns.push_back(Turn{.role = message.role, .blocks = std::move(blocks)});
  }

  std::ostringstream body;
  body << "{\"model\":" << common::json_quote(request.model)
       << ",\"max_tokens\":" << request.max_tokens.value_or(kDefaultMaxTokens);
  if (!system.empty()) {
    body << ",\"system\":" << common::json_quote(system);
  }
  body << ",\"messages\":[";
  for (std::size_t i = 0; i < turns.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << "{\"role\":\"" << role_name(turns[i].role) << "\",\"content\":[";
    for (std::size_t b = 0; b < turns[i].blocks.size(); ++b) {
      if (b > 0) {
        body << ',';
      }
      body << turns[i].blocks[b];
    }
    body << "]}";
  }
  body << "]";

  if (!request.tools.empty()) {
    body << ",\"tools\":[";
    for (std::size_t i = 0; i < request.tools.size(); ++i) {
      const auto &tool = request.tools[i];
      if (i > 0) {
        body << ',';
      }
      body << "{\"name\":" << common::json_quote(tool.name)
           << ",\"description\":" << common::json_quote(tool.description)
           << ",\"input_schema\":" << tool.parameters_json() << "}";
    }
    body << "]";
    if (!request.allow_tool_calls) {
      body << ",\"tool_choice\":{\"type\":\"none\"}";
    }
  }
  if (request.temperature.has_value()) {
    body << ",\"temperature\":" << *request.temperature;
  }
  body << "}";
  return body.str();
}

common::Result<ChatResponse> AnthropicProvider::parse_response(const std::string &body) {
  auto root = common::json_parse_object(body);
  if (!root.ok()) {
    return provider_failure(invalid("response is not a JSON object: " + root.error()));
  }
  const auto content_it = root.value().find("content");
  if (content_it == root.value().end()) {
    return provider_failure(invalid("content field missing"));
  }
  auto blocks = common::json_parse_array(content_it->second);
  if (!blocks.ok()) {
    return provider_failure(invalid("content is not an array"));
  }

  ChatResponse response;
  for (std::size_t i = 0; i < blocks.value().size(); ++i) {
    auto block = common::json_parse_object(blocks.value()[i]);
    if (!block.ok()) {
      return provider_failure(invalid("content[" + std::to_string(i) + "] is not an object"));
    }
    const std::string type = common::json_field_string(block.value(), "type");
    if (type == "text") {
      response.content += common::json_field_string(block.value(), "text");
    } else if (type == "tool_use") {
      tools::ToolCall call;
      call.id = common::json_field_string(block.value(), "id");
      call.name = common::json_field_string(block.value(), "name");
      const auto input_it = block.value().find("input");
      call.arguments = input_it == block.value().end() ? "{}" : input_it->second;
      if (call.name.empty()) {
        return provider_failure(invalid("tool_use block without a name"));
      }
      response.tool_calls.push_back(std::move(call));
    }
  }

  const auto usage_it = root.value().find("usage");
  if (usage_it != root.value().end()) {
    if (auto usage = common::json_parse_object(usage_it->second); usage.ok()) {
      response.usage.input_tokens = usage_number(usage.value(), "input_tokens");
      response.usage.output_tokens = usage_number(usage.value(), "output_tokens");
    }
  }
  return common::Result<ChatResponse>::success(std::move(response));
}

common::Result<ChatResponse> AnthropicProvider::chat(const ChatRequest &request) {
  if (api_key_.empty()) {
    return provider_failure(
        {.code = ProviderErrorCode::AuthError, .message = "missing API key for anthropic"});
  }

  const common::HttpRequest http_request{.method = "POST",
                                         .url = messages_url(),
                                         .headers = {{"Content-Type", "application/json"},
                                                     {"x-api-key", api_key_},
                                                     {"anthropic-version", kApiVersion}},
                                         .body = build_body(request),
                                         .timeout_ms = timeout_ms_};
  const auto response = http_client_->send(http_request);
  if (auto error = classify_response(response); error.has_value()) {
    return provider_failure(*error);
  }
  return parse_response(response.body);
}

std::string AnthropicProvider::name() const { return "anthropic"; }

} // namespace tai::providers
