#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tai/cli/commands.hpp"
#include "tai/config/config.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

/// Captures std::cout and std::cerr while a CLI command runs.
class CapturedOutput {
public:
  CapturedOutput()
      : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}
  ~CapturedOutput() {
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
  }

  CapturedOutput(const CapturedOutput &) = delete;
  CapturedOutput &operator=(const CapturedOutput &) = delete;

  [[nodiscard]] std::string out() const { return out_.str(); }
  [[nodiscard]] std::string err() const { return err_.str(); }

private:
  std::ostringstream out_;
  std::ostringstream err_;
  std::streambuf *old_out_;
  std::streambuf *old_err_;
};

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

CliRun run(std::vector<std::string> args) {
  args.insert(args.begin(), "tai");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  CliRun result;
  {
    CapturedOutput captured;
    result.code = tai::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    result.out = captured.out();
    result.err = captured.err();
  }
  tai::config::clear_config_path_override();
  return result;
}

} // namespace

void register_cli_tests(std::vector<tai::tests::TestCase> &tests) {
  using tai::tests::contains;
  using tai::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = run({"--version"});
                     require(version.code == 0, "version should succeed");
                     require(version.out.rfind("tai ", 0) == 0, "version text: " + version.out);
                     const auto help = run({"-h"});
                     require(help.code == 0 && contains(help.out, "USAGE"), "help text missing");
                     require(contains(help.out, "--clear-history"), "flag not documented");
                   }});

  tests.push_back({"cli_config_set_global_then_get", [] {
                     tai::testing::TempWorkspace home;
                     const auto path = (home.path() / "config.tai").string();
                     const auto set = run({"--config", path, "config", "set", "tools.list_limit",
                                           "5", "--global"});
                     require(set.code == 0, set.err);
                     require(contains(set.out, "Set tools.list_limit in " + path), set.out);
                     const auto get = run({"--config=" + path, "config", "get", "tools.list_limit"});
                     require(get.code == 0 && get.out == "5\n", "get output: " + get.out);
                     const auto where = run({"--config", path, "config", "path"});
                     require(contains(where.out, "global: " + path), where.out);
                   }});

  tests.push_back({"cli_config_provider_commands", [] {
                     tai::testing::TempWorkspace home;
                     tai::testing::ScopedEnv provider_env("TAI_PROVIDER", "");
                     tai::testing::ScopedEnv model_env("TAI_MODEL", "");
                     const auto path = (home.path() / "config.tai").string();
                     const auto bad = run({"--config", path, "config", "provider", "set", "bogus"});
                     require(bad.code == 1 && contains(bad.err, "Unknown provider"),
                             "unknown provider should fail");
                     const auto good = run({"--config", path, "config", "provider", "set", "lmstudio"});
                     require(good.code == 0, good.err);
                     const auto list = run({"--config", path, "config", "provider", "list"});
                     require(contains(list.out, "* lmstudio\n"), "active provider not marked");
                     const auto section = run({"--config", path, "config", "ollama", "--host",
                                               "http://gpu:11434", "--model", "qwen"});
                     require(section.code == 0, section.err);
                     const auto show = run({"--config", path, "config", "provider", "show", "ollama"});
                     require(contains(show.out, "model = qwen\n") &&
                                 contains(show.out, "base_url = http://gpu:11434/v1\n"),
                             show.out);
                   }});

  tests.push_back({"cli_rejects_unknown_config_command", [] {
                     tai::testing::TempWorkspace home;
                     const auto path = (home.path() / "config.tai").string();
                     const auto result = run({"--config", path, "config", "frobnicate"});
                     require(result.code == 1, "unknown command should fail");
                     require(contains(result.err, "unknown config command"), result.err);
                     require(run({"--config"}).code == 1, "missing option value should fail");
                   }});

  tests.push_back({"cli_clear_history", [] {
                     tai::testing::TempWorkspace home;
                     home.create_file("history.json", R"({"entries":[]})");
                     home.create_file("config.tai", "[history]\npath = \"" +
                                                        (home.path() / "history.json").string() +
                                                        "\"\n");
                     const auto path = (home.path() / "config.tai").string();
                     const auto result = run({"--config", path, "--clear-history"});
                     require(result.code == 0, result.err);
                     require(result.out == "History cleared\n", result.out);
                     require(!std::filesystem::exists(home.path() / "history.json"),
                             "history file should be removed");
                   }});
}
