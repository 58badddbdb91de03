#pragma once

#include "tai/providers/traits.hpp"

#include <memory>
#include <string>

namespace tai::providers {

/// Anthropic Messages API (`/v1/messages`) with tool_use / tool_result blocks.
class AnthropicProvider final : public Provider {
public:
  AnthropicProvider(std::string api_key, std::string base_url,
                    std::shared_ptr<common::HttpClient> http_client,
                    std::uint64_t timeout_ms = 120'000);

  [[nodiscard]] common::Result<ChatResponse> chat(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::string build_body(const ChatRequest &request) const;
  [[nodiscard]] static common::Result<ChatResponse> parse_response(const std::string &body);

private:
  [[nodiscard]] std::string messages_url() const;

  std::string api_key_;
  std::string base_url_;
  std::shared_ptr<common::HttpClient> http_client_;
  std::uint64_t timeout_ms_ = 120'000;
};

} // namespace tai::providers
