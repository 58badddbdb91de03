#include "tai/config/config.hpp"

#include "tai/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace tai::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".config/tai";
constexpr const char *CONFIG_FILENAME = "config.tai";
constexpr const char *LOCAL_CONFIG_FILENAME = ".config.tai";
std::optional<std::filesystem::path> g_config_path_override;

enum class ValueKind { String, Double, UInt, StringArray };

struct KeySpec {
  std::string key;
  ValueKind kind;
};

const std::vector<KeySpec> &key_specs() {
  static const std::vector<KeySpec> specs = [] {
    std::vector<KeySpec> out = {
        {"provider", ValueKind::String},
        {"model", ValueKind::String},
        {"temperature", ValueKind::Double},
        {"max_tokens", ValueKind::UInt},
        {"global_contexts", ValueKind::StringArray},
    };
    for (const std::string name : {"openai", "anthropic", "ollama", "lmstudio"}) {
      out.push_back({name + ".model", ValueKind::String});
      out.push_back({name + (name == "ollama" ? ".host" : ".base_url"), ValueKind::String});
      out.push_back({name + ".temperature", ValueKind::Double});
      out.push_back({name + ".max_tokens", ValueKind::UInt});
      if (name == "openai" || name == "anthropic") {
        out.push_back({name + ".api_key", ValueKind::String});
      }
    }
    out.push_back({"agent.max_tool_iterations", ValueKind::UInt});
    out.push_back({"history.max_entries", ValueKind::UInt});
    out.push_back({"history.window_minutes", ValueKind::UInt});
    out.push_back({"history.path", ValueKind::String});
    out.push_back({"tools.shell_timeout_sec", ValueKind::UInt});
    out.push_back({"tools.fetch_timeout_sec", ValueKind::UInt});
    out.push_back({"tools.fetch_max_bytes", ValueKind::UInt});
    out.push_back({"tools.list_limit", ValueKind::UInt});
    out.push_back({"tools.glob_limit", ValueKind::UInt});
    out.push_back({"tools.grep_max_results", ValueKind::UInt});
    out.push_back({"observability.backend", ValueKind::String});
    return out;
  }();
  return specs;
}

const KeySpec *find_key_spec(const std::string &key) {
  for (const auto &spec : key_specs()) {
    if (spec.key == key) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TAI_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  // The config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

const ProviderSettings *find_provider_settings(const Config &config, const std::string &name) {
  if (name == "openai") {
    return &config.openai;
  }
  if (name == "anthropic") {
    return &config.anthropic;
  }
  if (name == "ollama") {
    return &config.ollama;
  }
  if (name == "lmstudio") {
    return &config.lmstudio;
  }
  return nullptr;
}

// Reads typed values out of a document, keeping the first type error.
class DocumentReader {
public:
  explicit DocumentReader(const common::TomlDocument &doc) : doc_(doc) {}

  [[nodiscard]] std::optional<std::string> string(const std::string &key) {
    return take(key, &common::TomlDocument::string_at);
  }
  [[nodiscard]] std::optional<double> number(const std::string &key) {
    return take(key, &common::TomlDocument::number_at);
  }
  [[nodiscard]] std::optional<std::uint64_t> u64(const std::string &key) {
    return take(key, &common::TomlDocument::u64_at);
  }
  [[nodiscard]] std::optional<std::uint32_t> u32(const std::string &key) {
    const auto value = u64(key);
    if (!value.has_value()) {
      return std::nullopt;
    }
    if (*value > std::numeric_limits<std::uint32_t>::max()) {
      record("line " + std::to_string(doc_.find(key)->line) + ": '" + key +
             "' is out of range");
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(*value);
  }
  [[nodiscard]] std::optional<std::vector<std::string>> strings(const std::string &key) {
    return take(key, &common::TomlDocument::string_array_at);
  }

  [[nodiscard]] const common::Status &status() const { return status_; }

private:
  template <typename T>
  std::optional<T>
  take(const std::string &key,
       common::Result<T> (common::TomlDocument::*getter)(const std::string &) const) {
    if (!doc_.has(key)) {
      return std::nullopt;
    }
    auto value = (doc_.*getter)(key);
    if (!value.ok()) {
      record(value.error());
      return std::nullopt;
    }
    return std::move(value.value());
  }

  void record(const std::string &message) {
    if (status_.ok()) {
      status_ = common::Status::error(common::ErrorKind::Config, message);
    }
  }

  const common::TomlDocument &doc_;
  common::Status status_ = common::Status::success();
};

void apply_provider_section(ProviderSettings &settings, DocumentReader &read,
                            const std::string &section) {
  if (auto model = read.string(section + ".model")) {
    settings.model = *model;
  }
  const std::string url_key = section + (section == "ollama" ? ".host" : ".base_url");
  if (auto url = read.string(url_key)) {
    settings.base_url = expand_config_value(*url);
  }
  if (auto temperature = read.number(section + ".temperature")) {
    settings.temperature = *temperature;
  }
  if (auto max_tokens = read.u32(section + ".max_tokens")) {
    settings.max_tokens = *max_tokens;
  }
  if (auto key = read.string(section + ".api_key")) {
    settings.api_key = expand_config_value(*key);
  }
}

std::string format_double(const double value) {
  std::ostringstream stream;
  stream << value;
  return stream.str();
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

std::string join(const std::vector<std::string> &values, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

template <typename T> std::string optional_text(const std::optional<T> &value) {
  if (!value.has_value()) {
    return "<not set>";
  }
  if constexpr (std::is_same_v<T, double>) {
    return format_double(*value);
  } else if constexpr (std::is_same_v<T, std::string>) {
    return *value;
  } else {
    return std::to_string(*value);
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }

    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Config, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

common::Result<std::filesystem::path> context_dir() {
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / "context");
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::optional<std::filesystem::path> find_local_config(const std::filesystem::path &working_dir) {
  std::error_code ec;
  const auto local = working_dir / LOCAL_CONFIG_FILENAME;
  if (std::filesystem::is_regular_file(local, ec)) {
    return local;
  }
  if (const auto root = common::find_git_root(working_dir); root.has_value()) {
    const auto at_root = *root / LOCAL_CONFIG_FILENAME;
    if (std::filesystem::is_regular_file(at_root, ec)) {
      return at_root;
    }
  }
  return std::nullopt;
}

std::filesystem::path local_config_target(const std::filesystem::path &working_dir) {
  if (const auto root = common::find_git_root(working_dir); root.has_value()) {
    return *root / LOCAL_CONFIG_FILENAME;
  }
  return working_dir / LOCAL_CONFIG_FILENAME;
}

common::Status apply_document(Config &config, const common::TomlDocument &doc) {
  DocumentReader read(doc);
  if (auto provider = read.string("provider")) {
    config.provider = common::to_lower(common::trim(*provider));
  }
  if (auto model = read.string("model")) {
    config.model = *model;
  }
  if (auto temperature = read.number("temperature")) {
    config.temperature = *temperature;
  }
  if (auto max_tokens = read.u32("max_tokens")) {
    config.max_tokens = *max_tokens;
  }
  if (auto contexts = read.strings("global_contexts")) {
    config.global_contexts = std::move(*contexts);
  }

  apply_provider_section(config.openai, read, "openai");
  apply_provider_section(config.anthropic, read, "anthropic");
  apply_provider_section(config.ollama, read, "ollama");
  apply_provider_section(config.lmstudio, read, "lmstudio");

  if (auto iterations = read.u32("agent.max_tool_iterations")) {
    config.agent.max_tool_iterations = *iterations;
  }
  if (auto entries = read.u64("history.max_entries")) {
    config.history.max_entries = static_cast<std::size_t>(*entries);
  }
  if (auto window = read.u32("history.window_minutes")) {
    config.history.window_minutes = *window;
  }
  if (auto path = read.string("history.path")) {
    config.history.path = *path;
  }

  if (auto timeout = read.u64("tools.shell_timeout_sec")) {
    config.tools.shell_timeout_sec = *timeout;
  }
  if (auto timeout = read.u64("tools.fetch_timeout_sec")) {
    config.tools.fetch_timeout_sec = *timeout;
  }
  if (auto bytes = read.u64("tools.fetch_max_bytes")) {
    config.tools.fetch_max_bytes = *bytes;
  }
  if (auto limit = read.u64("tools.list_limit")) {
    config.tools.list_limit = static_cast<std::size_t>(*limit);
  }
  if (auto limit = read.u64("tools.glob_limit")) {
    config.tools.glob_limit = static_cast<std::size_t>(*limit);
  }
  if (auto limit = read.u64("tools.grep_max_results")) {
    config.tools.grep_max_results = static_cast<std::size_t>(*limit);
  }

  if (auto backend = read.string("observability.backend")) {
    config.observability.backend = *backend;
  }
  return read.status();
}

void apply_env_overrides(Config &config) {
  if (const auto provider = env_value("TAI_PROVIDER"); provider.has_value()) {
    config.provider = common::to_lower(common::trim(*provider));
  }
  if (const auto model = env_value("TAI_MODEL"); model.has_value()) {
    config.model = *model;
  }
  if (const auto key = env_value("OPENAI_API_KEY"); key.has_value()) {
    config.openai.api_key = *key;
  }
  if (const auto key = env_value("ANTHROPIC_API_KEY"); key.has_value()) {
    config.anthropic.api_key = *key;
  }
  if (const auto backend = env_value("TAI_LOG"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<common::TomlDocument> read_config_document(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<common::TomlDocument>::success(common::TomlDocument{});
  }
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<common::TomlDocument>::failure(common::ErrorKind::Config,
                                                         content.error());
  }
  auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<common::TomlDocument>::failure(
        common::ErrorKind::Config, path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Result<Config> load_config() {
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           "unable to resolve current directory: " +
                                               ec.message());
  }
  return load_config(cwd);
}

common::Result<Config> load_config(const std::filesystem::path &working_dir) {
  load_dotenv_files();

  Config config;

  const auto global_path = config_path();
  if (!global_path.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config, global_path.error());
  }
  auto global_doc = read_config_document(global_path.value());
  if (!global_doc.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config, global_doc.error());
  }
  if (auto applied = apply_document(config, global_doc.value()); !applied.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           global_path.value().string() + ": " + applied.error());
  }

  if (const auto local_path = find_local_config(working_dir);
      local_path.has_value() && *local_path != global_path.value()) {
    auto local_doc = read_config_document(*local_path);
    if (!local_doc.ok()) {
      return common::Result<Config>::failure(common::ErrorKind::Config, local_doc.error());
    }
    if (auto applied = apply_document(config, local_doc.value()); !applied.ok()) {
      return common::Result<Config>::failure(common::ErrorKind::Config,
                                             local_path->string() + ": " + applied.error());
    }
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config_document(const common::TomlDocument &doc) {
  return common::render_toml(doc);
}

common::Status save_config_document(const common::TomlDocument &doc,
                                    const std::filesystem::path &path) {
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Status::error(common::ErrorKind::Config, dir.error());
    }
  }
  return common::write_file_atomic(path, render_config_document(doc));
}

const std::vector<std::string> &known_config_keys() {
  static const std::vector<std::string> keys = [] {
    std::vector<std::string> out;
    for (const auto &spec : key_specs()) {
      out.push_back(spec.key);
    }
    return out;
  }();
  return keys;
}

bool is_secret_config_key(const std::string &key) { return common::ends_with(key, "api_key"); }

common::Result<std::string> get_config_value(const Config &config, const std::string &key) {
  if (find_key_spec(key) == nullptr) {
    return common::Result<std::string>::failure(common::ErrorKind::Config,
                                                "Unknown config key: " + key);
  }

  if (key == "provider") {
    return common::Result<std::string>::success(config.provider);
  }
  if (key == "model") {
    return common::Result<std::string>::success(optional_text(config.model));
  }
  if (key == "temperature") {
    return common::Result<std::string>::success(optional_text(config.temperature));
  }
  if (key == "max_tokens") {
    return common::Result<std::string>::success(optional_text(config.max_tokens));
  }
  if (key == "global_contexts") {
    return common::Result<std::string>::success(
        config.global_contexts.empty() ? "<none>" : join(config.global_contexts, ", "));
  }
  if (key == "agent.max_tool_iterations") {
    return common::Result<std::string>::success(std::to_string(config.agent.max_tool_iterations));
  }
  if (key == "history.max_entries") {
    return common::Result<std::string>::success(std::to_string(config.history.max_entries));
  }
  if (key == "history.window_minutes") {
    return common::Result<std::string>::success(std::to_string(config.history.window_minutes));
  }
  if (key == "history.path") {
    return common::Result<std::string>::success(config.history.path);
  }
  if (key == "tools.shell_timeout_sec") {
    return common::Result<std::string>::success(std::to_string(config.tools.shell_timeout_sec));
  }
  if (key == "tools.fetch_timeout_sec") {
    return common::Result<std::string>::success(std::to_string(config.tools.fetch_timeout_sec));
  }
  if (key == "tools.fetch_max_bytes") {
    return common::Result<std::string>::success(std::to_string(config.tools.fetch_max_bytes));
  }
  if (key == "tools.list_limit") {
    return common::Result<std::string>::success(std::to_string(config.tools.list_limit));
  }
  if (key == "tools.glob_limit") {
    return common::Result<std::string>::success(std::to_string(config.tools.glob_limit));
  }
  if (key == "tools.grep_max_results") {
    return common::Result<std::string>::success(std::to_string(config.tools.grep_max_results));
  }
  if (key == "observability.backend") {
    return common::Result<std::string>::success(config.observability.backend);
  }

  const auto dot = key.find('.');
  const std::string section = key.substr(0, dot);
  const std::string field = key.substr(dot + 1);
  const ProviderSettings settings = provider_settings(config, section);
  if (field == "model") {
    return common::Result<std::string>::success(optional_text(settings.model));
  }
  if (field == "base_url" || field == "host") {
    return common::Result<std::string>::success(optional_text(settings.base_url));
  }
  if (field == "temperature") {
    return common::Result<std::string>::success(optional_text(settings.temperature));
  }
  if (field == "max_tokens") {
    return common::Result<std::string>::success(optional_text(settings.max_tokens));
  }
  return common::Result<std::string>::success(settings.api_key.has_value() ? "***"
                                                                            : "<not set>");
}

common::Result<std::vector<std::string>> set_config_value(const std::filesystem::path &path,
                                                          const std::string &key,
                                                          const std::string &value) {
  using ResultT = common::Result<std::vector<std::string>>;
  const KeySpec *spec = find_key_spec(key);
  if (spec == nullptr) {
    return ResultT::failure(common::ErrorKind::Config, "Unknown config key: " + key);
  }

  std::vector<std::string> warnings;
  std::string raw;
  const std::string trimmed = common::trim(value);
  switch (spec->kind) {
  case ValueKind::String:
    raw = common::quote_toml_string(key == "provider" ? common::to_lower(trimmed) : value);
    break;
  case ValueKind::Double: {
    char *end = nullptr;
    (void)std::strtod(trimmed.c_str(), &end);
    if (trimmed.empty() || end != trimmed.c_str() + trimmed.size()) {
      return ResultT::failure(common::ErrorKind::Validation,
                              "Invalid number for " + key + ": " + value);
    }
    raw = trimmed;
    break;
  }
  case ValueKind::UInt: {
    std::uint64_t parsed = 0;
    const auto *first = trimmed.data();
    const auto *last = first + trimmed.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (trimmed.empty() || ec != std::errc() || ptr != last) {
      return ResultT::failure(common::ErrorKind::Validation,
                              "Invalid non-negative integer for " + key + ": " + value);
    }
    raw = trimmed;
    break;
  }
  case ValueKind::StringArray: {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
      item = common::trim(item);
      if (!item.empty()) {
        items.push_back(item);
      }
    }
    if (key == "global_contexts") {
      if (auto dir = context_dir(); dir.ok()) {
        std::error_code ec;
        for (const auto &name : items) {
          if (!std::filesystem::exists(dir.value() / (name + ".context.tai"), ec)) {
            warnings.push_back("Context file does not exist: " + name + ".context.tai");
          }
        }
      }
    }
    raw = string_array_to_toml(items);
    break;
  }
  }

  if (key == "provider" && !provider_is_known(common::to_lower(trimmed))) {
    return ResultT::failure(common::ErrorKind::Validation, "Unknown provider: " + value);
  }

  auto doc = read_config_document(path);
  if (!doc.ok()) {
    return ResultT::failure(common::ErrorKind::Config, doc.error());
  }
  auto parsed = common::parse_toml_value(raw);
  if (!parsed.ok()) {
    return ResultT::failure(common::ErrorKind::Validation,
                            "Invalid value for " + key + ": " + parsed.error());
  }
  doc.value().set(key, std::move(parsed.value()));
  if (auto saved = save_config_document(doc.value(), path); !saved.ok()) {
    return ResultT::failure(saved.kind(), saved.error());
  }
  return ResultT::success(std::move(warnings));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ResultT = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!provider_is_known(config.provider)) {
    return ResultT::failure(common::ErrorKind::Config, "Unknown provider: " + config.provider);
  }

  const auto check_temperature = [](const std::optional<double> &value) {
    return !value.has_value() || (*value >= 0.0 && *value <= 2.0);
  };
  if (!check_temperature(config.temperature)) {
    return ResultT::failure(common::ErrorKind::Config,
                            "temperature must be between 0.0 and 2.0");
  }
  for (const std::string name : {"openai", "anthropic", "ollama", "lmstudio"}) {
    if (!check_temperature(provider_settings(config, name).temperature)) {
      return ResultT::failure(common::ErrorKind::Config,
                              name + ".temperature must be between 0.0 and 2.0");
    }
  }

  if (config.agent.max_tool_iterations == 0) {
    return ResultT::failure(common::ErrorKind::Config,
                            "agent.max_tool_iterations must be at least 1");
  }
  if (config.history.max_entries == 0) {
    return ResultT::failure(common::ErrorKind::Config, "history.max_entries must be at least 1");
  }
  if (config.tools.shell_timeout_sec == 0) {
    return ResultT::failure(common::ErrorKind::Config,
                            "tools.shell_timeout_sec must be at least 1");
  }
  if (config.tools.fetch_timeout_sec == 0) {
    return ResultT::failure(common::ErrorKind::Config,
                            "tools.fetch_timeout_sec must be at least 1");
  }
  if (config.tools.fetch_max_bytes == 0) {
    return ResultT::failure(common::ErrorKind::Config, "tools.fetch_max_bytes must be at least 1");
  }

  if (config.max_tokens.has_value() && *config.max_tokens == 0) {
    warnings.push_back("max_tokens is 0; the provider default will be used");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "none" && backend != "noop" && backend != "log" &&
      backend.find(',') == std::string::npos) {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  const std::string provider = resolve_provider_name(config);
  if (provider == "anthropic" && !config.anthropic.api_key.has_value()) {
    warnings.push_back("ANTHROPIC_API_KEY is not set");
  }
  if (provider == "openai" && !config.openai.api_key.has_value()) {
    warnings.push_back("OPENAI_API_KEY is not set");
  }

  return ResultT::success(std::move(warnings));
}

const std::vector<std::string> &known_providers() {
  static const std::vector<std::string> providers = {"anthropic", "openai", "ollama",
                                                     "lmstudio"};
  return providers;
}

bool provider_is_known(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  if (normalized == "auto") {
    return true;
  }
  const auto &providers = known_providers();
  return std::find(providers.begin(), providers.end(), normalized) != providers.end();
}

ProviderSettings provider_settings(const Config &config, const std::string &name) {
  if (const auto *settings = find_provider_settings(config, name); settings != nullptr) {
    return *settings;
  }
  return {};
}

std::string resolve_provider_name(const Config &config) {
  const std::string provider = common::to_lower(common::trim(config.provider));
  if (!provider.empty() && provider != "auto") {
    return provider;
  }
  if (config.anthropic.api_key.has_value() && !config.anthropic.api_key->empty()) {
    return "anthropic";
  }
  if (config.openai.api_key.has_value() && !config.openai.api_key->empty()) {
    return "openai";
  }
  return "ollama";
}

common::Result<EffectiveProvider> effective_provider(const Config &config,
                                                     const std::string &name) {
  if (name == "auto" || !provider_is_known(name)) {
    return common::Result<EffectiveProvider>::failure(common::ErrorKind::Config,
                                                      "Unknown provider: " + name);
  }

  const ProviderSettings settings = provider_settings(config, name);
  EffectiveProvider out;
  out.name = name;

  std::string default_model;
  std::string default_url;
  if (name == "anthropic") {
    default_model = "claude-sonnet-4-20250514";
    default_url = "https://api.anthropic.com";
  } else if (name == "openai") {
    default_model = "gpt-4o-mini";
    default_url = "https://api.openai.com/v1";
  } else if (name == "ollama") {
    default_model = "llama3.1";
    default_url = "http://localhost:11434";
  } else {
    default_model = "local-model";
    default_url = "http://localhost:1234/v1";
  }

  // Top-level keys (and TAI_MODEL) take precedence over the provider section.
  out.model = config.model.value_or(settings.model.value_or(default_model));
  out.base_url = settings.base_url.value_or(default_url);
  while (!out.base_url.empty() && out.base_url.back() == '/') {
    out.base_url.pop_back();
  }
  if (name == "ollama" && !common::ends_with(out.base_url, "/v1")) {
    out.base_url += "/v1";
  }
  out.temperature = config.temperature.value_or(settings.temperature.value_or(0.2));
  out.max_tokens = config.max_tokens.value_or(settings.max_tokens.value_or(4096));

  if (name == "lmstudio") {
    out.api_key = config.openai.api_key.value_or("lm-studio");
  } else {
    out.api_key = settings.api_key.value_or("");
  }
  return common::Result<EffectiveProvider>::success(std::move(out));
}

} // namespace tai::config
