#include "tai/cli/commands.hpp"

#include "tai/agent/context.hpp"
#include "tai/agent/history.hpp"
#include "tai/agent/tool_display.hpp"
#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"
#include "tai/config/config.hpp"
#include "tai/runtime/app.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>
#include <vector>

namespace tai::cli {

namespace {

constexpr std::size_t kDefaultTerminalRows = 50;

std::string version_string() {
#ifdef TAI_VERSION
  std::string version = TAI_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef TAI_GIT_COMMIT
  const std::string commit = TAI_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "tai " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes `name VALUE` from args. A trailing `name` without value is an error.
bool take_option(std::vector<std::string> &args, const std::string &name,
                 std::optional<std::string> &out_value, std::string &error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], name + "=")) {
      out_value = args[i].substr(name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  std::optional<std::string> path;
  if (!take_option(args, "--config", path, error)) {
    return false;
  }
  if (path.has_value()) {
    if (path->empty()) {
      error = "missing value for --config";
      return false;
    }
    config::set_config_path_override(std::filesystem::path(*path));
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

/// Reads lines until an empty line follows some content, or EOF.
std::string read_prompt(std::istream &in, std::ostream &out) {
  out << "> " << std::flush;
  std::string input;
  std::string line;
  while (std::getline(in, line)) {
    input += line;
    input += '\n';
    if (common::trim(line).empty() && !common::trim(input).empty()) {
      break;
    }
  }
  return common::trim(input);
}

std::size_t terminal_rows() {
  winsize size{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_row > 0) {
    return size.ws_row;
  }
  return kDefaultTerminalRows;
}

std::filesystem::path current_dir() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return std::filesystem::path(".");
  }
  return cwd;
}

void print_warnings(const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
}

void print_tool_call(const tools::ToolCall &call) {
  std::cout << "Tool call: " << call.name << "\n";
  const std::string params = agent::format_tool_params(call.arguments);
  if (!params.empty()) {
    std::cout << "params:\n" << params;
  }
}

void print_tool_result(const tools::ToolResult &result) {
  auto fields = common::json_parse_object(result.payload);
  if (!result.success) {
    const std::string message =
        fields.ok() ? common::json_field_string(fields.value(), "error", result.payload)
                    : result.payload;
    std::cerr << "Tool error (" << result.name << "): " << message << "\n";
    return;
  }
  if (result.name == "run_shell" && fields.ok() &&
      fields.value().count("combined") != 0) {
    const std::string combined = common::json_field_string(fields.value(), "combined");
    std::cout << combined;
    if (!combined.empty() && combined.back() != '\n') {
      std::cout << "\n";
    }
    return;
  }
  std::cout << "result:\n" << result.payload << "\n";
}

std::string join_names(const std::vector<agent::ContextFile> &files) {
  std::string out;
  for (const auto &file : files) {
    if (!out.empty()) {
      out += ", ";
    }
    out += file.name;
  }
  return out;
}

int run_chat(std::vector<std::string> args) {
  const bool no_context = take_flag(args, "--nocontext");
  const bool clear_history = take_flag(args, "--clear-history");
  std::optional<std::string> named_context;
  std::string error;
  if (!take_option(args, "--context", named_context, error)) {
    std::cerr << error << "\n";
    return 1;
  }

  const auto cwd = current_dir();
  auto context = runtime::RuntimeContext::from_disk(cwd);
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto &ctx = context.value();

  if (clear_history) {
    if (auto cleared = agent::InteractionHistory::clear(ctx.history_path()); !cleared.ok()) {
      std::cerr << cleared.error() << "\n";
      return 1;
    }
    std::cout << "History cleared\n";
    return 0;
  }

  auto validated = config::validate_config(ctx.config());
  if (!validated.ok()) {
    std::cerr << validated.error() << "\n";
    return 1;
  }
  print_warnings(validated.value());

  std::string user_input = join_tokens(args);
  if (user_input.empty()) {
    user_input = read_prompt(std::cin, std::cout);
    if (user_input.empty()) {
      return 0;
    }
  }

  agent::PromptInputs prompt_inputs{.os_name = agent::host_os_name(),
                                    .max_words = agent::max_words_for_rows(terminal_rows()),
                                    .contexts = {},
                                    .history = {}};
  if (!no_context) {
    auto contexts = ctx.load_contexts(named_context);
    if (!contexts.ok()) {
      std::cerr << contexts.error() << "\n";
      return 1;
    }
    print_warnings(contexts.value().warnings);
    prompt_inputs.contexts = std::move(contexts.value().files);
    if (!prompt_inputs.contexts.empty()) {
      std::cout << "Using context files: [" << join_names(prompt_inputs.contexts) << "]\n";
    }
  }

  agent::EngineCallbacks callbacks{.on_tool_call = print_tool_call,
                                   .on_tool_result = print_tool_result};
  auto session =
      ctx.create_session(runtime::RuntimeServices::system(std::cin, std::cout), callbacks);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }

  const auto &settings = session.value()->provider_settings();
  std::cout << "Using provider " << settings.name << " (model: " << settings.model
            << "; base: " << settings.base_url << ")\n";

  if (const auto &log = session.value()->interaction_log(); log) {
    prompt_inputs.history = log->relevant_entries(
        std::time(nullptr), std::chrono::minutes(ctx.config().history.window_minutes));
  }

  auto turn = session.value()->run_turn(agent::build_system_prompt(prompt_inputs), user_input);
  if (!turn.ok()) {
    std::cerr << "Error: " << turn.error() << "\n";
    return 1;
  }
  std::cout << turn.value().text << "\n";
  return 0;
}

common::Result<std::filesystem::path> config_target(const bool global) {
  if (global) {
    return config::config_path();
  }
  return common::Result<std::filesystem::path>::success(
      config::local_config_target(current_dir()));
}

int store_value(const std::filesystem::path &path, const std::string &key,
                const std::string &value) {
  auto stored = config::set_config_value(path, key, value);
  if (!stored.ok()) {
    std::cerr << stored.error() << "\n";
    return 1;
  }
  print_warnings(stored.value());
  std::cout << "Set " << key << " in " << path.string() << "\n";
  return 0;
}

int run_config_provider(std::vector<std::string> args, const config::Config &cfg) {
  if (args.empty()) {
    std::cerr << "usage: tai config provider list|show NAME|set NAME|auto\n";
    return 1;
  }
  const std::string action = args[0];

  if (action == "list") {
    const std::string active = config::resolve_provider_name(cfg);
    for (const auto &name : config::known_providers()) {
      std::cout << (name == active ? "* " : "  ") << name << "\n";
    }
    if (common::to_lower(cfg.provider) == "auto") {
      std::cout << "(provider is auto)\n";
    }
    return 0;
  }

  if (action == "show") {
    const std::string name =
        args.size() >= 2 ? common::to_lower(args[1]) : config::resolve_provider_name(cfg);
    auto effective = config::effective_provider(cfg, name);
    if (!effective.ok()) {
      std::cerr << effective.error() << "\n";
      return 1;
    }
    const auto &p = effective.value();
    std::cout << "provider = " << p.name << "\n"
              << "model = " << p.model << "\n"
              << "base_url = " << p.base_url << "\n"
              << "temperature = " << p.temperature << "\n"
              << "max_tokens = " << p.max_tokens << "\n"
              << "api_key = " << (p.api_key.empty() ? "<not set>" : "***") << "\n";
    return 0;
  }

  if (action == "set" || action == "auto") {
    std::string name = "auto";
    if (action == "set") {
      if (args.size() < 2) {
        std::cerr << "usage: tai config provider set NAME\n";
        return 1;
      }
      name = args[1];
    }
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    return store_value(path.value(), "provider", name);
  }

  std::cerr << "unknown provider command: " << action << "\n";
  return 1;
}

int run_config_provider_section(const std::string &provider, std::vector<std::string> args) {
  const std::string url_key = provider == "ollama" ? "host" : "base_url";
  const std::vector<std::pair<std::string, std::string>> options = {
      {"--model", "model"},
      {provider == "ollama" ? "--host" : "--base-url", url_key},
      {"--temperature", "temperature"},
      {"--max-tokens", "max_tokens"},
  };

  auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }

  bool any = false;
  for (const auto &[flag, key] : options) {
    std::optional<std::string> value;
    std::string error;
    if (!take_option(args, flag, value, error)) {
      std::cerr << error << "\n";
      return 1;
    }
    if (!value.has_value()) {
      continue;
    }
    any = true;
    if (store_value(path.value(), provider + "." + key, *value) != 0) {
      return 1;
    }
  }
  if (!args.empty()) {
    std::cerr << "unknown option: " << args[0] << "\n";
    return 1;
  }
  if (!any) {
    std::cerr << "usage: tai config " << provider << " --model M " << options[1].first
              << " URL --temperature T --max-tokens N\n";
    return 1;
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  const auto cwd = current_dir();
  auto cfg = config::load_config(cwd);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    for (const auto &key : config::known_config_keys()) {
      auto value = config::get_config_value(cfg.value(), key);
      if (value.ok()) {
        std::cout << key << " = " << value.value() << "\n";
      }
    }
    return 0;
  }

  const std::string action = args[0];
  args.erase(args.begin());

  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << "global: " << path.value().string() << "\n";
    if (auto local = config::find_local_config(cwd); local.has_value()) {
      std::cout << "local: " << local->string() << "\n";
    }
    return 0;
  }

  if (action == "get") {
    if (args.empty()) {
      std::cerr << "usage: tai config get KEY\n";
      return 1;
    }
    auto value = config::get_config_value(cfg.value(), args[0]);
    if (!value.ok()) {
      std::cerr << value.error() << "\n";
      return 1;
    }
    std::cout << value.value() << "\n";
    return 0;
  }

  if (action == "set") {
    const bool global = take_flag(args, "--global");
    if (args.size() < 2) {
      std::cerr << "usage: tai config set KEY VALUE [--global]\n";
      return 1;
    }
    auto target = config_target(global);
    if (!target.ok()) {
      std::cerr << target.error() << "\n";
      return 1;
    }
    return store_value(target.value(), args[0], join_tokens(args, 1));
  }

  if (action == "provider") {
    return run_config_provider(std::move(args), cfg.value());
  }

  if (config::provider_is_known(action) && action != "auto") {
    return run_config_provider_section(action, std::move(args));
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n"
            << "USAGE\n"
            << "  tai [--config PATH] [--nocontext] [--context NAME] [--clear-history] "
               "MESSAGE...\n"
            << "  tai [--config PATH] config <command>\n\n"
            << "With no MESSAGE, a prompt is read from stdin until an empty line.\n\n"
            << "OPTIONS\n"
            << "  --config PATH     Use PATH as the global configuration file\n"
            << "  --nocontext       Do not load .context.tai files\n"
            << "  --context NAME    Load the named context instead of the local one\n"
            << "  --clear-history   Forget previous interactions and exit\n"
            << "  -h, --help        Show this help\n"
            << "  -V, --version     Show the version\n\n"
            << "CONFIG\n"
            << "  config show                     Print the merged configuration\n"
            << "  config get KEY                  Print one key\n"
            << "  config set KEY VALUE [--global] Store a key locally or globally\n"
            << "  config path                     Print configuration file locations\n"
            << "  config provider list|show NAME|set NAME|auto\n"
            << "  config openai|anthropic|lmstudio [--model M] [--base-url U] "
               "[--temperature T] [--max-tokens N]\n"
            << "  config ollama [--model M] [--host H] [--temperature T] [--max-tokens N]\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (!args.empty()) {
    const std::string &first = args[0];
    if (first == "--help" || first == "-h") {
      print_help();
      return 0;
    }
    if (first == "--version" || first == "-V") {
      std::cout << version_string() << "\n";
      return 0;
    }
    if (first == "config") {
      args.erase(args.begin());
      return run_config(std::move(args));
    }
  }

  return run_chat(std::move(args));
}

} // namespace tai::cli
