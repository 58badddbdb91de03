#include "tai/tools/builtin/shell.hpp"

#include "tai/common/json_util.hpp"
#include "tai/common/process.hpp"
#include "tai/observability/global.hpp"
#include "tai/tools/args.hpp"

#include <chrono>
#include <sstream>

namespace tai::tools {

namespace {

constexpr std::size_t kMaxOutputBytes = 1024 * 1024;
constexpr std::uint64_t kMaxTimeoutSec = 24 * 60 * 60;
constexpr std::string_view kTruncatedMarker = "\n[output truncated]";

#ifdef __APPLE__
constexpr std::string_view kOsName = "Mac OS";
#else
constexpr std::string_view kOsName = "Linux";
#endif

std::string not_executed_payload(const std::string &command, const std::string &flag,
                                 const bool value) {
  std::ostringstream out;
  out << "{\"command\":" << common::json_quote(command) << ",\"executed\":false,\"" << flag
      << "\":" << (value ? "true" : "false") << "}";
  return out.str();
}

std::string combine_output(const std::string &stdout_text, const std::string &stderr_text) {
  if (stderr_text.empty()) {
    return stdout_text;
  }
  if (stdout_text.empty()) {
    return stderr_text;
  }
  return stdout_text + "\n" + stderr_text;
}

} // namespace

ShellTool::ShellTool(std::shared_ptr<security::PathSandbox> sandbox,
                     std::shared_ptr<security::ApprovalPrompt> approval,
                     std::shared_ptr<common::Clipboard> clipboard,
                     const std::uint64_t default_timeout_sec)
    : sandbox_(std::move(sandbox)), approval_(std::move(approval)),
      clipboard_(std::move(clipboard)), default_timeout_sec_(default_timeout_sec) {}

std::string_view ShellTool::name() const { return "run_shell"; }

std::string_view ShellTool::description() const {
  static const std::string text =
      "Execute a " + std::string(kOsName) + " shell command on the user's machine. The machine runs " +
      std::string(kOsName) +
      ". The user can see the command output! Use for tasks that require terminal operations. "
      "Always prefer safe, idempotent commands and avoid destructive operations.";
  return text;
}

std::vector<ToolParameter> ShellTool::parameters() const {
  return {
      {.name = "command",
       .type = "string",
       .description = "The exact shell command to execute (Using `sh -c`)",
       .required = true},
      {.name = "timeout_sec",
       .type = "integer",
       .description = "Optional timeout in seconds (defaults to 120)"},
  };
}

common::Result<std::string> ShellTool::execute(const ToolArgs &args) {
  auto command = required_string(args, "command");
  if (!command.ok()) {
    return command;
  }
  if (command.value().empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Missing required argument: command");
  }
  auto timeout_sec = u64_in_range(args, "timeout_sec", default_timeout_sec_, 1, kMaxTimeoutSec);
  if (!timeout_sec.ok()) {
    return common::Result<std::string>::failure(timeout_sec.kind(), timeout_sec.error());
  }

  auto decision = approval_->ask(command.value());
  if (!decision.ok()) {
    return common::Result<std::string>::failure(decision.kind(), decision.error());
  }
  if (decision.value() == security::ApprovalDecision::Skip) {
    return common::Result<std::string>::success(
        not_executed_payload(command.value(), "skipped", true));
  }
  if (decision.value() == security::ApprovalDecision::CopyToClipboard) {
    const auto copied = clipboard_->copy(command.value());
    if (!copied.ok()) {
      observability::record_error("run_shell", copied.error());
    }
    return common::Result<std::string>::success(
        not_executed_payload(command.value(), "copied", copied.ok()));
  }

  auto output = common::run_process(common::ProcessOptions{
      .argv = {"/bin/sh", "-c", command.value()},
      .working_dir = sandbox_->root(),
      .stdin_data = std::nullopt,
      .timeout = std::chrono::seconds(timeout_sec.value()),
      .max_output_bytes = kMaxOutputBytes,
  });
  if (!output.ok()) {
    return common::Result<std::string>::failure(output.kind(), output.error());
  }
  auto &result = output.value();
  if (result.timed_out) {
    return common::Result<std::string>::failure(
        common::ErrorKind::Timeout,
        "Command timed out after " + std::to_string(timeout_sec.value()) + "s");
  }

  if (result.stdout_truncated) {
    result.stdout_text += kTruncatedMarker;
  }
  if (result.stderr_truncated) {
    result.stderr_text += kTruncatedMarker;
  }

  std::ostringstream out;
  out << "{\"command\":" << common::json_quote(command.value()) << ",\"executed\":true"
      << ",\"exit_code\":";
  if (result.exit_code.has_value()) {
    out << *result.exit_code;
  } else {
    out << "null";
  }
  out << ",\"stdout\":" << common::json_quote(result.stdout_text)
      << ",\"stderr\":" << common::json_quote(result.stderr_text)
      << ",\"combined\":" << common::json_quote(combine_output(result.stdout_text, result.stderr_text))
      << "}";
  return common::Result<std::string>::success(out.str());
}

std::string_view ShellTool::group() const { return "process"; }

} // namespace tai::tools
