#pragma once

#include "tai/agent/context.hpp"
#include "tai/agent/engine.hpp"
#include "tai/agent/history.hpp"
#include "tai/common/clipboard.hpp"
#include "tai/common/http.hpp"
#include "tai/common/result.hpp"
#include "tai/config/schema.hpp"
#include "tai/providers/traits.hpp"
#include "tai/security/approval.hpp"
#include "tai/tools/tool_registry.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace tai::runtime {

/// Host-facing collaborators a session needs. Tests substitute fakes.
struct RuntimeServices {
  std::shared_ptr<common::HttpClient> http;
  std::shared_ptr<security::ApprovalPrompt> approval;
  std::shared_ptr<common::Clipboard> clipboard;
  /// When set, used instead of building a provider from the configuration.
  std::shared_ptr<providers::Provider> provider;

  [[nodiscard]] static RuntimeServices system(std::istream &in, std::ostream &out);
};

/// Everything one CLI invocation talks to. Not movable: the engine refers to
/// the registry owned alongside it.
class Session {
public:
  Session(config::EffectiveProvider provider_settings, tools::ToolRegistry registry,
          std::shared_ptr<providers::Provider> provider, agent::EngineOptions options,
          agent::EngineCallbacks callbacks,
          std::shared_ptr<agent::InteractionHistory> interaction_log);
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  [[nodiscard]] common::Result<agent::TurnResult> run_turn(const std::string &system_prompt,
                                                           const std::string &user_input);

  [[nodiscard]] const config::EffectiveProvider &provider_settings() const {
    return provider_settings_;
  }
  [[nodiscard]] const tools::ToolRegistry &registry() const { return registry_; }
  [[nodiscard]] const agent::ConversationEngine &engine() const { return engine_; }
  [[nodiscard]] const std::shared_ptr<agent::InteractionHistory> &interaction_log() const {
    return interaction_log_;
  }

private:
  config::EffectiveProvider provider_settings_;
  tools::ToolRegistry registry_;
  std::shared_ptr<agent::InteractionHistory> interaction_log_;
  agent::ConversationEngine engine_;
};

class RuntimeContext {
public:
  RuntimeContext(config::Config config, std::filesystem::path working_dir);

  [[nodiscard]] static common::Result<RuntimeContext>
  from_disk(const std::filesystem::path &working_dir);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::filesystem::path &working_dir() const { return working_dir_; }

  [[nodiscard]] common::Result<config::EffectiveProvider> effective_provider() const;
  [[nodiscard]] std::filesystem::path history_path() const;
  [[nodiscard]] common::Result<agent::ContextLoad>
  load_contexts(const std::optional<std::string> &named) const;
  [[nodiscard]] common::Result<std::shared_ptr<agent::InteractionHistory>> open_history() const;

  /// Installs the configured observer, then wires sandbox, tools, provider and engine.
  [[nodiscard]] common::Result<std::unique_ptr<Session>>
  create_session(RuntimeServices services, agent::EngineCallbacks callbacks = {}) const;

private:
  config::Config config_;
  std::filesystem::path working_dir_;
};

} // namespace tai::runtime
