#include "tai/runtime/app.hpp"

#include "tai/common/fs.hpp"
#include "tai/config/config.hpp"
#include "tai/observability/factory.hpp"
#include "tai/observability/global.hpp"
#include "tai/providers/factory.hpp"
#include "tai/security/sandbox.hpp"

namespace tai::runtime {

RuntimeServices RuntimeServices::system(std::istream &in, std::ostream &out) {
  return RuntimeServices{
      .http = std::make_shared<common::CurlHttpClient>(),
      .approval = std::make_shared<security::TerminalApprovalPrompt>(in, out),
      .clipboard = std::make_shared<common::SystemClipboard>(),
      .provider = nullptr,
  };
}

Session::Session(config::EffectiveProvider provider_settings, tools::ToolRegistry registry,
                 std::shared_ptr<providers::Provider> provider, agent::EngineOptions options,
                 agent::EngineCallbacks callbacks,
                 std::shared_ptr<agent::InteractionHistory> interaction_log)
    : provider_settings_(std::move(provider_settings)), registry_(std::move(registry)),
      interaction_log_(std::move(interaction_log)),
      engine_(std::move(provider), registry_, std::move(options), std::move(callbacks),
              interaction_log_) {}

common::Result<agent::TurnResult> Session::run_turn(const std::string &system_prompt,
                                                    const std::string &user_input) {
  return engine_.run_turn(system_prompt, user_input);
}

RuntimeContext::RuntimeContext(config::Config config, std::filesystem::path working_dir)
    : config_(std::move(config)), working_dir_(std::move(working_dir)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk(const std::filesystem::path &working_dir) {
  auto loaded = config::load_config(working_dir);
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.kind(), loaded.error());
  }
  return common::Result<RuntimeContext>::success(
      RuntimeContext(std::move(loaded.value()), working_dir));
}

common::Result<config::EffectiveProvider> RuntimeContext::effective_provider() const {
  return config::effective_provider(config_, config::resolve_provider_name(config_));
}

std::filesystem::path RuntimeContext::history_path() const {
  return std::filesystem::path(common::expand_path(config_.history.path));
}

common::Result<agent::ContextLoad>
RuntimeContext::load_contexts(const std::optional<std::string> &named) const {
  auto dir = config::context_dir();
  if (!dir.ok()) {
    return common::Result<agent::ContextLoad>::failure(dir.kind(), dir.error());
  }
  return agent::find_context_files(working_dir_, named, config_.global_contexts, dir.value());
}

common::Result<std::shared_ptr<agent::InteractionHistory>> RuntimeContext::open_history() const {
  using ResultT = common::Result<std::shared_ptr<agent::InteractionHistory>>;
  auto loaded = agent::InteractionHistory::load(history_path(), config_.history.max_entries);
  if (!loaded.ok()) {
    return ResultT::failure(loaded.kind(), loaded.error());
  }
  return ResultT::success(
      std::make_shared<agent::InteractionHistory>(std::move(loaded.value())));
}

common::Result<std::unique_ptr<Session>>
RuntimeContext::create_session(RuntimeServices services, agent::EngineCallbacks callbacks) const {
  using ResultT = common::Result<std::unique_ptr<Session>>;
  observability::set_global_observer(observability::create_observer(config_));

  auto settings = effective_provider();
  if (!settings.ok()) {
    return ResultT::failure(settings.kind(), settings.error());
  }

  auto sandbox = security::PathSandbox::create(working_dir_);
  if (!sandbox.ok()) {
    return ResultT::failure(sandbox.kind(), sandbox.error());
  }
  auto sandbox_ptr = std::make_shared<security::PathSandbox>(std::move(sandbox.value()));

  std::shared_ptr<providers::Provider> provider = services.provider;
  if (!provider) {
    auto created = providers::create_provider(settings.value(), services.http);
    if (!created.ok()) {
      return ResultT::failure(created.kind(), created.error());
    }
    provider = created.value();
  }

  auto history = open_history();
  if (!history.ok()) {
    return ResultT::failure(history.kind(), history.error());
  }

  auto registry = tools::ToolRegistry::create_default(
      sandbox_ptr, std::move(services.approval), std::move(services.clipboard),
      std::move(services.http), config_.tools);

  agent::EngineOptions options{.provider_name = settings.value().name,
                               .model = settings.value().model,
                               .temperature = settings.value().temperature,
                               .max_tokens = settings.value().max_tokens,
                               .max_tool_iterations = config_.agent.max_tool_iterations};

  return ResultT::success(std::make_unique<Session>(settings.value(), std::move(registry),
                                                    std::move(provider), std::move(options),
                                                    std::move(callbacks), history.value()));
}

} // namespace tai::runtime
