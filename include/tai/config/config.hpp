#pragma once

#include "tai/common/result.hpp"
#include "tai/common/toml.hpp"
#include "tai/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tai::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
/// Global config file, `~/.config/tai/config.tai` unless overridden.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] common::Result<std::filesystem::path> context_dir();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// `.config.tai` in `working_dir`, else at its git root. Only existing files are returned.
[[nodiscard]] std::optional<std::filesystem::path>
find_local_config(const std::filesystem::path &working_dir);
/// Where a non-global `config set` writes: the git root if there is one, else `working_dir`.
[[nodiscard]] std::filesystem::path local_config_target(const std::filesystem::path &working_dir);

/// Defaults, then the global file, then the local file, then environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &working_dir);

/// Apply every key present in `doc` on top of `config`. A value of the wrong
/// type is an ErrorKind::Config failure naming the key and its line.
[[nodiscard]] common::Status apply_document(Config &config, const common::TomlDocument &doc);
void apply_env_overrides(Config &config);

[[nodiscard]] common::Result<common::TomlDocument> read_config_document(
    const std::filesystem::path &path);
[[nodiscard]] std::string render_config_document(const common::TomlDocument &doc);
[[nodiscard]] common::Status save_config_document(const common::TomlDocument &doc,
                                                  const std::filesystem::path &path);

[[nodiscard]] const std::vector<std::string> &known_config_keys();
[[nodiscard]] bool is_secret_config_key(const std::string &key);

/// Display value of `key` in the merged configuration. Secrets are masked.
[[nodiscard]] common::Result<std::string> get_config_value(const Config &config,
                                                           const std::string &key);

/// Validate and store one key in the file at `path`. Returns warnings.
[[nodiscard]] common::Result<std::vector<std::string>>
set_config_value(const std::filesystem::path &path, const std::string &key,
                 const std::string &value);

/// Returns warnings; hard problems are reported as a failure.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] const std::vector<std::string> &known_providers();
[[nodiscard]] bool provider_is_known(const std::string &provider);
[[nodiscard]] ProviderSettings provider_settings(const Config &config, const std::string &name);
/// Concrete provider name for `config.provider`, resolving `auto` from available API keys.
[[nodiscard]] std::string resolve_provider_name(const Config &config);
[[nodiscard]] common::Result<EffectiveProvider> effective_provider(const Config &config,
                                                                  const std::string &name);

} // namespace tai::config
