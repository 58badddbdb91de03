#pragma once

#include "tai/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace tai::providers {

/// Speaks the OpenAI `/chat/completions` protocol. Used for openai, ollama
/// and lmstudio, which differ only in base URL and key handling.
class CompatibleProvider final : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<common::HttpClient> http_client, bool require_api_key = true,
                     std::uint64_t timeout_ms = 120'000);

  [[nodiscard]] common::Result<ChatResponse> chat(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::string build_body(const ChatRequest &request) const;
  [[nodiscard]] static common::Result<ChatResponse> parse_response(const std::string &body);

private:
  /// OpenAI reasoning models reject sampling parameters.
  [[nodiscard]] bool omits_sampling(const std::string &model) const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<common::HttpClient> http_client_;
  bool require_api_key_ = true;
  std::uint64_t timeout_ms_ = 120'000;
};

} // namespace tai::providers
