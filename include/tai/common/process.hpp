#pragma once

#include "tai/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tai::common {

struct ProcessOptions {
  std::vector<std::string> argv;
  std::filesystem::path working_dir;
  /// Bytes written to the child's stdin. When unset stdin is /dev/null.
  std::optional<std::string> stdin_data;
  /// The group is killed once this much time has elapsed; zero kills on the
  /// first check. Values above one week are clamped.
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ProcessOutput {
  /// Unset when the child was terminated by a signal.
  std::optional<int> exit_code;
  int term_signal = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  bool timed_out = false;
};

/// Spawn argv[0] (PATH lookup) in its own process group and collect both output
/// streams. On timeout the whole group is killed and reaped before returning
/// with `timed_out` set. Spawn failures are ErrorKind::Process.
[[nodiscard]] Result<ProcessOutput> run_process(const ProcessOptions &options);

/// True when `program` resolves through PATH to an executable file.
[[nodiscard]] bool program_on_path(const std::string &program);

} // namespace tai::common
