#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tai/tools/builtin/shell.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace {

struct ShellFixture {
  tai::testing::TempWorkspace ws;
  std::shared_ptr<tai::testing::ScriptedApproval> approval =
      std::make_shared<tai::testing::ScriptedApproval>();
  std::shared_ptr<tai::testing::FakeClipboard> clipboard =
      std::make_shared<tai::testing::FakeClipboard>();

  [[nodiscard]] tai::tools::ShellTool tool(std::uint64_t timeout_sec = 120) const {
    return tai::tools::ShellTool(ws.sandbox(), approval, clipboard, timeout_sec);
  }
};

} // namespace

void register_shell_tests(std::vector<tai::tests::TestCase> &tests) {
  using tai::tests::contains;
  using tai::tests::require;
  namespace common = tai::common;
  namespace security = tai::security;
  using tai::testing::parse_payload;

  tests.push_back({"shell_executes_in_workspace_root", [] {
                     ShellFixture fx;
                     auto tool = fx.tool();
                     auto result = tool.execute(parse_payload(R"({"command":"pwd; echo oops 1>&2; exit 4"})"));
                     require(result.ok(), result.error());
                     const auto fields = parse_payload(result.value());
                     require(fields.at("executed") == "true", "command should run");
                     require(fields.at("exit_code") == "4", "exit code mismatch");
                     require(common::json_field_string(fields, "stdout") ==
                                 fx.ws.path().string() + "\n",
                             "cwd should be the workspace root");
                     require(common::json_field_string(fields, "stderr") == "oops\n",
                             "stderr mismatch");
                     require(contains(common::json_field_string(fields, "combined"), "oops"),
                             "combined should include stderr");
                     require(fx.approval->asked().size() == 1, "approval not requested");
                   }});

  tests.push_back({"shell_invalid_utf8_output_is_replaced", [] {
                     ShellFixture fx;
                     auto tool = fx.tool();
                     auto result =
                         tool.execute(parse_payload(R"({"command":"printf 'ok\\377'"})"));
                     require(result.ok(), result.error());
                     const auto fields = parse_payload(result.value());
                     require(common::json_field_string(fields, "stdout") == "ok\xEF\xBF\xBD",
                             "stdout should carry U+FFFD");
                   }});

  tests.push_back({"shell_skip_does_not_spawn", [] {
                     ShellFixture fx;
                     fx.approval->set_decision(security::ApprovalDecision::Skip);
                     auto tool = fx.tool();
                     auto result =
                         tool.execute(parse_payload(R"({"command":"touch created.txt"})"));
                     require(result.ok(), result.error());
                     const auto fields = parse_payload(result.value());
                     require(fields.at("executed") == "false", "should not execute");
                     require(fields.at("skipped") == "true", "skipped flag missing");
                     require(!std::filesystem::exists(fx.ws.path() / "created.txt"),
                             "command must not run");
                   }});

  tests.push_back({"shell_copy_uses_clipboard", [] {
                     ShellFixture fx;
                     fx.approval->set_decision(security::ApprovalDecision::CopyToClipboard);
                     auto tool = fx.tool();
                     auto result = tool.execute(parse_payload(R"({"command":"make install"})"));
                     require(result.ok(), result.error());
                     const auto fields = parse_payload(result.value());
                     require(fields.at("executed") == "false", "should not execute");
                     require(fields.at("copied") == "true", "copied flag mismatch");
                     require(fx.clipboard->copied().size() == 1 &&
                                 fx.clipboard->copied()[0] == "make install",
                             "command not copied");
                   }});

  tests.push_back({"shell_copy_reports_missing_clipboard", [] {
                     ShellFixture fx;
                     fx.approval->set_decision(security::ApprovalDecision::CopyToClipboard);
                     fx.clipboard->set_available(false);
                     auto tool = fx.tool();
                     auto result = tool.execute(parse_payload(R"({"command":"ls"})"));
                     require(result.ok(), result.error());
                     require(parse_payload(result.value()).at("copied") == "false",
                             "copy failure should be reported in payload");
                   }});

  tests.push_back({"shell_timeout_kills_command_group", [] {
                     ShellFixture fx;
                     auto tool = fx.tool();
                     const auto started = std::chrono::steady_clock::now();
                     auto result = tool.execute(parse_payload(
                         R"({"command":"sleep 30 & echo $! > bg.pid; wait","timeout_sec":1})"));
                     require(!result.ok(), "timeout should fail");
                     require(result.kind() == common::ErrorKind::Timeout, "kind mismatch");
                     require(contains(result.error(), "timed out after 1s"), "message mismatch");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(10),
                             "command was not killed");
                     const long background =
                         tai::testing::read_pid_file(fx.ws.path() / "bg.pid");
                     require(tai::testing::process_gone(background),
                             "background job outlived the timeout");
                   }});

  tests.push_back({"shell_rejects_out_of_range_timeout", [] {
                     ShellFixture fx;
                     auto tool = fx.tool();
                     for (const std::string timeout : {"0", "86401", "18446744073709551615"}) {
                       const auto started = std::chrono::steady_clock::now();
                       auto result = tool.execute(parse_payload(
                           R"({"command":"sleep 3; echo done","timeout_sec":)" + timeout + "}"));
                       require(!result.ok(), "timeout_sec " + timeout + " should be rejected");
                       require(result.kind() == common::ErrorKind::Validation, "kind mismatch");
                       require(contains(result.error(), "timeout_sec"), "message should name key");
                       require(std::chrono::steady_clock::now() - started <
                                   std::chrono::seconds(2),
                               "command must not run");
                     }
                     require(fx.approval->asked().empty(), "no prompt for invalid input");
                   }});

  tests.push_back({"shell_rejects_empty_command", [] {
                     ShellFixture fx;
                     auto tool = fx.tool();
                     auto result = tool.execute(parse_payload(R"({"command":""})"));
                     require(!result.ok(), "empty command should fail");
                     require(result.kind() == common::ErrorKind::Validation, "kind mismatch");
                     require(fx.approval->asked().empty(), "no prompt for invalid input");
                   }});
}
