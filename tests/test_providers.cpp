#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tai/providers/anthropic.hpp"
#include "tai/providers/compatible.hpp"
#include "tai/providers/factory.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace {

using tai::providers::ChatMessage;
using tai::providers::ChatRequest;
using tai::providers::Role;
using tai::tools::ToolCall;
using tai::tools::ToolResult;

ChatRequest tool_round_request() {
  return ChatRequest{
      .model = "gpt-4o-mini",
      .messages =
          {ChatMessage{.role = Role::System, .content = "be brief"},
           ChatMessage{.role = Role::User, .content = "list files"},
           ChatMessage{.role = Role::Assistant,
                       .content = "",
                       .tool_calls = {ToolCall{.id = "call_1",
                                               .name = "list_dir",
                                               .arguments = R"({"path":"."})"}}},
           ChatMessage{.role = Role::User,
                       .content = "",
                       .tool_results = {ToolResult{.id = "call_1",
                                                   .name = "list_dir",
                                                   .payload = R"({"entries":[]})",
                                                   .success = true}}},
           ChatMessage{.role = Role::User, .content = "now answer"}},
      .tools = {tai::tools::ToolSpec{
          .name = "list_dir", .description = "List a directory", .parameters = {}, .group = "fs"}},
      .temperature = 0.2,
      .max_tokens = 256};
}

} // namespace

void register_providers_tests(std::vector<tai::tests::TestCase> &tests) {
  using tai::tests::contains;
  using tai::tests::require;
  namespace common = tai::common;
  namespace providers = tai::providers;
  namespace testing = tai::testing;

  tests.push_back({"compatible_body_carries_tools_and_results", [] {
                     providers::CompatibleProvider provider(
                         "openai", "https://api.openai.com/v1", "sk",
                         std::make_shared<testing::FakeHttpClient>());
                     const auto body = provider.build_body(tool_round_request());
                     require(contains(body, R"({"role":"system","content":"be brief"})"),
                             "system message missing");
                     require(contains(body, R"("content":null,"tool_calls":[{"id":"call_1")"),
                             "assistant tool call missing");
                     require(contains(body, R"("arguments":"{\"path\":\".\"}")"),
                             "arguments must be an encoded string");
                     require(contains(body, R"({"role":"tool","tool_call_id":"call_1")"),
                             "tool result message missing");
                     require(contains(body, R"("tool_choice":"auto")"), "tool choice missing");
                     require(contains(body, R"("temperature":0.2)"), "temperature missing");
                     require(contains(body, R"("max_tokens":256)"), "max tokens missing");
                     require(common::json_parse_object(body).ok(), "body must be valid JSON");
                   }});

  tests.push_back({"compatible_body_omits_sampling_for_reasoning_models", [] {
                     providers::CompatibleProvider openai(
                         "openai", "https://api.openai.com/v1", "sk",
                         std::make_shared<testing::FakeHttpClient>());
                     auto request = tool_round_request();
                     request.model = "gpt-5-mini";
                     const auto body = openai.build_body(request);
                     require(!contains(body, "temperature") && !contains(body, "max_tokens"),
                             "sampling params must be omitted");

                     providers::CompatibleProvider ollama(
                         "ollama", "http://localhost:11434/v1", "",
                         std::make_shared<testing::FakeHttpClient>(), false);
                     require(contains(ollama.build_body(request), "temperature"),
                             "other servers keep sampling params");

                     request.tools.clear();
                     require(!contains(openai.build_body(request), "tool_choice"),
                             "empty catalog sends no tools");
                   }});

  tests.push_back({"compatible_parses_text_and_calls", [] {
                     auto text = providers::CompatibleProvider::parse_response(
                         R"({"choices":[{"message":{"role":"assistant","content":"hi"}}],)"
                         R"("usage":{"prompt_tokens":12,"completion_tokens":3}})");
                     require(text.ok(), text.error());
                     require(text.value().content == "hi" && !text.value().has_tool_calls(),
                             "text response mismatch");
                     require(text.value().usage.input_tokens == 12 &&
                                 text.value().usage.output_tokens == 3,
                             "usage mismatch");

                     auto calls = providers::CompatibleProvider::parse_response(
                         R"({"choices":[{"message":{"content":null,"tool_calls":[)"
                         R"({"id":"a","type":"function","function":{"name":"glob","arguments":"{\"pattern\":\"*.md\"}"}},)"
                         R"({"type":"function","function":{"name":"stat","arguments":{"path":"x"}}}]}}]})");
                     require(calls.ok(), calls.error());
                     const auto &parsed = calls.value().tool_calls;
                     require(parsed.size() == 2, "two calls expected");
                     require(parsed[0].id == "a" && parsed[0].arguments == R"({"pattern":"*.md"})",
                             "string arguments should be decoded");
                     require(parsed[1].id == "call_1" && parsed[1].arguments == R"({"path":"x"})",
                             "object arguments should be kept");
                   }});

  tests.push_back({"compatible_rejects_malformed_responses", [] {
                     auto missing = providers::CompatibleProvider::parse_response(R"({"id":"x"})");
                     require(!missing.ok() && missing.kind() == common::ErrorKind::Provider,
                             "missing choices should fail");
                     require(contains(missing.error(), "invalid_response"), "code missing");
                     auto garbage = providers::CompatibleProvider::parse_response("<html>");
                     require(!garbage.ok(), "non-JSON should fail");
                   }});

  tests.push_back({"compatible_chat_sends_auth_and_maps_errors", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     http->push_json(401, R"({"error":"bad key"})");
                     providers::CompatibleProvider provider("openai", "https://api.openai.com/v1/",
                                                            "sk-test", http);
                     auto result = provider.chat(tool_round_request());
                     require(!result.ok(), "401 should fail");
                     require(contains(result.error(), "[auth] status=401"), result.error());
                     const auto &sent = http->requests().at(0);
                     require(sent.url == "https://api.openai.com/v1/chat/completions",
                             "endpoint mismatch");
                     bool has_auth = false;
                     for (const auto &[name, value] : sent.headers) {
                       has_auth = has_auth || (name == "Authorization" && value == "Bearer sk-test");
                     }
                     require(has_auth, "bearer header missing");

                     providers::CompatibleProvider keyless("openai", "https://api.openai.com/v1",
                                                           "", http);
                     require(!keyless.chat(tool_round_request()).ok(), "missing key should fail");
                     require(http->requests().size() == 1, "no request without a key");
                   }});

  tests.push_back({"anthropic_body_uses_blocks_and_merges_roles", [] {
                     providers::AnthropicProvider provider(
                         "sk-ant", "https://api.anthropic.com",
                         std::make_shared<testing::FakeHttpClient>());
                     auto request = tool_round_request();
                     request.max_tokens.reset();
                     const auto body = provider.build_body(request);
                     require(contains(body, R"("system":"be brief")"), "system field missing");
                     require(contains(body, R"("max_tokens":4096)"), "default max tokens");
                     require(contains(body,
                                      R"({"type":"tool_use","id":"call_1","name":"list_dir","input":{"path":"."}})"),
                             "tool_use block missing");
                     require(contains(body,
                                      R"({"role":"user","content":[{"type":"tool_result","tool_use_id":"call_1")"),
                             "tool_result block missing");
                     require(contains(body,
                                      R"(,{"type":"text","text":"now answer"}]})"),
                             "steering should merge into the result turn");
                     require(contains(body, R"("input_schema":)"), "tool schema missing");
                     require(!contains(body, R"("role":"system")"), "no system role in messages");
                     require(common::json_parse_object(body).ok(), "body must be valid JSON");
                   }});

  tests.push_back({"anthropic_parses_mixed_content", [] {
                     auto parsed = providers::AnthropicProvider::parse_response(
                         R"({"content":[{"type":"text","text":"Checking."},)"
                         R"({"type":"tool_use","id":"tu_1","name":"grep","input":{"pattern":"TODO"}}],)"
                         R"("usage":{"input_tokens":40,"output_tokens":9}})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().content == "Checking.", "text mismatch");
                     require(parsed.value().tool_calls.size() == 1 &&
                                 parsed.value().tool_calls[0].arguments == R"({"pattern":"TODO"})",
                             "tool use mismatch");
                     require(parsed.value().usage.input_tokens == 40, "usage mismatch");
                   }});

  tests.push_back({"anthropic_chat_headers_and_url", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     http->push_json(200, R"({"content":[{"type":"text","text":"ok"}]})");
                     providers::AnthropicProvider provider("sk-ant", "https://proxy.local/v1",
                                                           http);
                     auto result = provider.chat(tool_round_request());
                     require(result.ok(), result.error());
                     const auto &sent = http->requests().at(0);
                     require(sent.url == "https://proxy.local/v1/messages", "url mismatch");
                     bool has_version = false;
                     bool has_key = false;
                     for (const auto &[name, value] : sent.headers) {
                       has_version = has_version || (name == "anthropic-version" && value == "2023-06-01");
                       has_key = has_key || (name == "x-api-key" && value == "sk-ant");
                     }
                     require(has_version && has_key, "anthropic headers missing");
                   }});

  tests.push_back({"classify_response_codes", [] {
                     common::HttpResponse timeout;
                     timeout.timeout = true;
                     require(providers::classify_response(timeout)->code ==
                                 providers::ProviderErrorCode::Timeout,
                             "timeout");

                     common::HttpResponse limited{.status = 429, .body = "slow down"};
                     limited.headers["retry-after"] = "30";
                     const auto rate = providers::classify_response(limited);
                     require(rate.has_value() &&
                                 rate->code == providers::ProviderErrorCode::RateLimitError &&
                                 rate->retry_after == std::optional<std::uint64_t>(30),
                             "rate limit");
                     require(contains(rate->to_string(), "retry_after=30s"), "retry text");

                     common::HttpResponse missing{.status = 404};
                     require(providers::classify_response(missing)->code ==
                                 providers::ProviderErrorCode::ModelNotFound,
                             "404");
                     common::HttpResponse server{.status = 503};
                     require(providers::classify_response(server)->code ==
                                 providers::ProviderErrorCode::ApiError,
                             "5xx");
                     common::HttpResponse fine{.status = 200};
                     require(!providers::classify_response(fine).has_value(), "2xx is fine");
                   }});

  tests.push_back({"normalize_arguments_defaults_to_empty_object", [] {
                     require(providers::normalize_arguments("") == "{}", "empty");
                     require(providers::normalize_arguments("[1]") == "{}", "array");
                     require(providers::normalize_arguments(R"( {"a":1} )") == R"({"a":1})",
                             "object kept");
                   }});

  tests.push_back({"provider_factory_by_name", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     tai::config::EffectiveProvider settings{.name = "anthropic",
                                                             .model = "m",
                                                             .base_url = "https://api.anthropic.com"};
                     auto anthropic = providers::create_provider(settings, http);
                     require(anthropic.ok() && anthropic.value()->name() == "anthropic",
                             "anthropic provider");
                     settings.name = "lmstudio";
                     auto lmstudio = providers::create_provider(settings, http);
                     require(lmstudio.ok() && lmstudio.value()->name() == "lmstudio",
                             "lmstudio provider");
                     settings.name = "gemini";
                     require(!providers::create_provider(settings, http).ok(), "unknown provider");
                     settings.name = "openai";
                     require(!providers::create_provider(settings, nullptr).ok(),
                             "http client required");
                   }});
}
