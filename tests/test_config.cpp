#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tai/config/config.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace {

/// Points the global config at a scratch directory and blanks the
/// environment variables that would otherwise leak into the merge.
class ConfigFixture {
public:
  ConfigFixture() {
    for (const char *name :
         {"TAI_PROVIDER", "TAI_MODEL", "TAI_LOG", "TAI_CONFIG_PATH", "OPENAI_API_KEY",
          "ANTHROPIC_API_KEY"}) {
      env_.push_back(std::make_unique<tai::testing::ScopedEnv>(name, ""));
    }
    tai::config::set_config_path_override(home.path() / "tai" / "config.tai");
  }
  ~ConfigFixture() { tai::config::clear_config_path_override(); }

  ConfigFixture(const ConfigFixture &) = delete;
  ConfigFixture &operator=(const ConfigFixture &) = delete;

  [[nodiscard]] std::filesystem::path global_path() const {
    return home.path() / "tai" / "config.tai";
  }

  tai::testing::TempWorkspace home;
  tai::testing::TempWorkspace project;

private:
  std::vector<std::unique_ptr<tai::testing::ScopedEnv>> env_;
};

} // namespace

void register_config_tests(std::vector<tai::tests::TestCase> &tests) {
  using tai::tests::contains;
  using tai::tests::require;
  namespace common = tai::common;
  namespace config = tai::config;

  tests.push_back({"config_defaults_without_files", [] {
                     ConfigFixture fx;
                     auto loaded = config::load_config(fx.project.path());
                     require(loaded.ok(), loaded.error());
                     const auto &cfg = loaded.value();
                     require(cfg.provider == "auto", "provider default");
                     require(!cfg.model.has_value(), "model should be unset");
                     require(cfg.agent.max_tool_iterations == 25, "iteration default");
                     require(cfg.history.max_entries == 10, "history default");
                     require(cfg.history.window_minutes == 60, "window default");
                     require(cfg.tools.shell_timeout_sec == 120, "shell timeout default");
                     require(cfg.tools.fetch_max_bytes == 200000, "fetch cap default");
                     require(cfg.observability.backend == "none", "backend default");
                     require(config::config_path().value() == fx.global_path(),
                             "override not honored");
                   }});

  tests.push_back({"config_local_overrides_global", [] {
                     ConfigFixture fx;
                     fx.home.create_file("tai/config.tai", "provider = \"openai\"\n"
                                                           "model = \"global-model\"\n"
                                                           "temperature = 0.5\n"
                                                           "\n"
                                                           "[tools]\n"
                                                           "list_limit = 7\n");
                     fx.project.create_file(".config.tai", "model = \"local-model\"\n");
                     auto loaded = config::load_config(fx.project.path());
                     require(loaded.ok(), loaded.error());
                     const auto &cfg = loaded.value();
                     require(cfg.provider == "openai", "global provider lost");
                     require(cfg.model == std::optional<std::string>("local-model"),
                             "local model should win");
                     require(cfg.temperature == std::optional<double>(0.5), "temperature lost");
                     require(cfg.tools.list_limit == 7, "section key lost");
                   }});

  tests.push_back({"config_local_file_found_at_git_root", [] {
                     ConfigFixture fx;
                     fx.project.create_dir(".git");
                     fx.project.create_dir("src/deep");
                     fx.project.create_file(".config.tai", "provider = \"ollama\"\n");
                     const auto found = config::find_local_config(fx.project.path() / "src/deep");
                     require(found.has_value() && *found == fx.project.path() / ".config.tai",
                             "git root config not found");
                     require(config::local_config_target(fx.project.path() / "src") ==
                                 fx.project.path() / ".config.tai",
                             "writes should target the git root");
                   }});

  tests.push_back({"config_env_overrides_files", [] {
                     ConfigFixture fx;
                     fx.home.create_file("tai/config.tai", "provider = \"openai\"\n");
                     tai::testing::ScopedEnv provider("TAI_PROVIDER", " Anthropic ");
                     tai::testing::ScopedEnv model("TAI_MODEL", "env-model");
                     tai::testing::ScopedEnv key("ANTHROPIC_API_KEY", "sk-ant");
                     auto loaded = config::load_config(fx.project.path());
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider == "anthropic", "env provider ignored");
                     require(loaded.value().model == std::optional<std::string>("env-model"),
                             "env model ignored");
                     require(loaded.value().anthropic.api_key == std::optional<std::string>("sk-ant"),
                             "env key ignored");
                   }});

  tests.push_back({"config_type_errors_name_file_and_line", [] {
                     ConfigFixture fx;
                     fx.home.create_file("tai/config.tai", "provider = \"openai\"\n");
                     fx.project.create_file(".config.tai", "model = \"m\"\n"
                                                           "temperature = \"hot\"\n");
                     auto loaded = config::load_config(fx.project.path());
                     require(!loaded.ok(), "string temperature accepted");
                     require(loaded.kind() == common::ErrorKind::Config, "wrong kind");
                     require(contains(loaded.error(), ".config.tai") &&
                                 contains(loaded.error(), "line 2") &&
                                 contains(loaded.error(), "temperature"),
                             loaded.error());

                     fx.project.create_file(".config.tai", "[openai]\nmax_tokens = 5000000000\n");
                     auto too_big = config::load_config(fx.project.path());
                     require(!too_big.ok() && contains(too_big.error(), "out of range"),
                             "u32 overflow accepted");
                   }});

  tests.push_back({"config_set_then_get", [] {
                     ConfigFixture fx;
                     auto set = config::set_config_value(fx.global_path(), "tools.list_limit", "50");
                     require(set.ok(), set.error());
                     require(config::set_config_value(fx.global_path(), "openai.api_key", "sk-x").ok(),
                             "secret set failed");
                     require(config::set_config_value(fx.global_path(), "provider", "OpenAI").ok(),
                             "provider set failed");

                     auto loaded = config::load_config(fx.project.path());
                     require(loaded.ok(), loaded.error());
                     require(config::get_config_value(loaded.value(), "tools.list_limit").value() ==
                                 "50",
                             "value not persisted");
                     require(config::get_config_value(loaded.value(), "openai.api_key").value() ==
                                 "***",
                             "secret should be masked");
                     require(loaded.value().provider == "openai", "provider not normalized");
                     require(contains(fx.home.read_file("tai/config.tai"), "[tools]\nlist_limit = 50"),
                             "section layout mismatch");
                   }});

  tests.push_back({"config_set_rejects_bad_input", [] {
                     ConfigFixture fx;
                     auto unknown = config::set_config_value(fx.global_path(), "nope", "1");
                     require(!unknown.ok() && unknown.kind() == common::ErrorKind::Config,
                             "unknown key should fail");
                     auto number = config::set_config_value(fx.global_path(), "max_tokens", "-3");
                     require(!number.ok() && number.kind() == common::ErrorKind::Validation,
                             "negative integer should fail");
                     auto real = config::set_config_value(fx.global_path(), "temperature", "warm");
                     require(!real.ok() && real.kind() == common::ErrorKind::Validation,
                             "bad number should fail");
                     auto provider = config::set_config_value(fx.global_path(), "provider", "bogus");
                     require(!provider.ok() && contains(provider.error(), "Unknown provider"),
                             "unknown provider should fail");
                     require(!std::filesystem::exists(fx.global_path()),
                             "failed sets must not write");
                   }});

  tests.push_back({"config_global_contexts_warn_when_missing", [] {
                     ConfigFixture fx;
                     fx.home.create_file("tai/context/rust.context.tai", "cargo");
                     auto set = config::set_config_value(fx.global_path(), "global_contexts",
                                                         "rust, missing");
                     require(set.ok(), set.error());
                     require(set.value().size() == 1 &&
                                 contains(set.value()[0], "missing.context.tai"),
                             "missing context should warn");
                     auto loaded = config::load_config(fx.project.path());
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().global_contexts ==
                                 std::vector<std::string>({"rust", "missing"}),
                             "contexts not stored");
                   }});

  tests.push_back({"config_validation", [] {
                     config::Config cfg;
                     cfg.provider = "ollama";
                     auto ok = config::validate_config(cfg);
                     require(ok.ok() && ok.value().empty(), "defaults should validate");

                     cfg.temperature = 2.5;
                     require(!config::validate_config(cfg).ok(), "temperature range");
                     cfg.temperature = 1.0;
                     cfg.agent.max_tool_iterations = 0;
                     require(!config::validate_config(cfg).ok(), "iterations must be positive");
                     cfg.agent.max_tool_iterations = 3;
                     cfg.tools.fetch_max_bytes = 0;
                     require(!config::validate_config(cfg).ok(), "fetch cap must be positive");
                     cfg.tools.fetch_max_bytes = 1000;

                     cfg.provider = "openai";
                     auto warned = config::validate_config(cfg);
                     require(warned.ok() && warned.value().size() == 1 &&
                                 warned.value()[0] == "OPENAI_API_KEY is not set",
                             "missing key should warn");
                     cfg.provider = "gemini";
                     require(!config::validate_config(cfg).ok(), "unknown provider");
                   }});

  tests.push_back({"config_effective_provider_defaults", [] {
                     config::Config cfg;
                     auto anthropic = config::effective_provider(cfg, "anthropic");
                     require(anthropic.ok(), anthropic.error());
                     require(anthropic.value().model == "claude-sonnet-4-20250514", "model");
                     require(anthropic.value().base_url == "https://api.anthropic.com", "url");
                     require(anthropic.value().temperature == 0.2, "temperature");
                     require(anthropic.value().max_tokens == 4096, "max tokens");

                     cfg.ollama.base_url = "http://gpu-box:11434/";
                     auto ollama = config::effective_provider(cfg, "ollama");
                     require(ollama.ok(), ollama.error());
                     require(ollama.value().base_url == "http://gpu-box:11434/v1",
                             "ollama needs the /v1 suffix");

                     auto lmstudio = config::effective_provider(cfg, "lmstudio");
                     require(lmstudio.ok() && lmstudio.value().api_key == "lm-studio",
                             "lmstudio placeholder key");

                     cfg.model = "top-level";
                     cfg.openai.model = "section";
                     require(config::effective_provider(cfg, "openai").value().model == "top-level",
                             "top-level model should win");

                     require(!config::effective_provider(cfg, "auto").ok(),
                             "auto must be resolved first");
                   }});

  tests.push_back({"config_resolves_auto_provider", [] {
                     config::Config cfg;
                     require(config::resolve_provider_name(cfg) == "ollama", "no keys -> ollama");
                     cfg.openai.api_key = "sk-o";
                     require(config::resolve_provider_name(cfg) == "openai", "openai key");
                     cfg.anthropic.api_key = "sk-a";
                     require(config::resolve_provider_name(cfg) == "anthropic",
                             "anthropic key wins");
                     cfg.provider = "LMStudio";
                     require(config::resolve_provider_name(cfg) == "lmstudio",
                             "explicit provider wins");
                   }});
}
