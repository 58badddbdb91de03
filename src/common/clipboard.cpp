#include "tai/common/clipboard.hpp"

#include "tai/common/process.hpp"

namespace tai::common {

namespace {

constexpr std::chrono::milliseconds kClipboardTimeout{5000};

} // namespace

SystemClipboard::SystemClipboard()
    : helpers_({{"wl-copy"},
                {"xclip", "-selection", "clipboard"},
                {"xsel", "--clipboard", "--input"},
                {"pbcopy"}}) {}

SystemClipboard::SystemClipboard(std::vector<std::vector<std::string>> helpers)
    : helpers_(std::move(helpers)) {}

Status SystemClipboard::copy(const std::string &text) {
  std::string last_error = "no clipboard helper found (tried wl-copy, xclip, xsel, pbcopy)";
  for (const auto &helper : helpers_) {
    if (helper.empty() || !program_on_path(helper.front())) {
      continue;
    }
    ProcessOptions options;
    options.argv = helper;
    options.stdin_data = text;
    options.timeout = kClipboardTimeout;
    auto run = run_process(options);
    if (!run.ok()) {
      last_error = run.error();
      continue;
    }
    const auto &output = run.value();
    if (output.timed_out) {
      last_error = helper.front() + " timed out";
      continue;
    }
    if (output.exit_code.has_value() && *output.exit_code == 0) {
      return Status::success();
    }
    last_error = helper.front() + " failed: " + output.stderr_text;
  }
  return Status::error(ErrorKind::Process, last_error);
}

} // namespace tai::common
