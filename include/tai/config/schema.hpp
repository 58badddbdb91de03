#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tai::config {

struct ProviderSettings {
  std::optional<std::string> model;
  /// `host` for ollama, `base_url` for the others.
  std::optional<std::string> base_url;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
  std::optional<std::string> api_key;
};

struct AgentConfig {
  std::uint32_t max_tool_iterations = 25;
};

struct HistoryConfig {
  std::size_t max_entries = 10;
  std::uint32_t window_minutes = 60;
  std::string path = "~/.tai.history";
};

struct ToolsConfig {
  std::uint64_t shell_timeout_sec = 120;
  std::uint64_t fetch_timeout_sec = 10;
  std::uint64_t fetch_max_bytes = 200'000;
  std::size_t list_limit = 1000;
  std::size_t glob_limit = 200;
  std::size_t grep_max_results = 100;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  std::string provider = "auto";
  std::optional<std::string> model;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
  std::vector<std::string> global_contexts;

  ProviderSettings openai;
  ProviderSettings anthropic;
  ProviderSettings ollama;
  ProviderSettings lmstudio;

  AgentConfig agent;
  HistoryConfig history;
  ToolsConfig tools;
  ObservabilityConfig observability;
};

/// Fully resolved settings for the provider a session talks to.
struct EffectiveProvider {
  std::string name;
  std::string model;
  std::string base_url;
  double temperature = 0.2;
  std::uint32_t max_tokens = 4096;
  std::string api_key;
};

} // namespace tai::config
