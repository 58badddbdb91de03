#include "tai/providers/factory.hpp"

#include "tai/providers/anthropic.hpp"
#include "tai/providers/compatible.hpp"

namespace tai::providers {

common::Result<std::shared_ptr<Provider>>
create_provider(const config::EffectiveProvider &settings,
                std::shared_ptr<common::HttpClient> http_client) {
  using ResultT = common::Result<std::shared_ptr<Provider>>;
  if (!http_client) {
    return ResultT::failure(common::ErrorKind::Config, "no HTTP client for provider");
  }

  if (settings.name == "anthropic") {
    return ResultT::success(std::make_shared<AnthropicProvider>(
        settings.api_key, settings.base_url, std::move(http_client)));
  }
  if (settings.name == "openai") {
    return ResultT::success(std::make_shared<CompatibleProvider>(
        "openai", settings.base_url, settings.api_key, std::move(http_client), true));
  }
  // Local servers accept requests without a key.
  if (settings.name == "ollama" || settings.name == "lmstudio") {
    return ResultT::success(std::make_shared<CompatibleProvider>(
        settings.name, settings.base_url, settings.api_key, std::move(http_client), false));
  }
  return ResultT::failure(common::ErrorKind::Config, "Unknown provider: " + settings.name);
}

} // namespace tai::providers
