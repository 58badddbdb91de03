#pragma once

namespace tai::cli {

/// Entry point for the `tai` binary. Returns the process exit code.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace tai::cli
