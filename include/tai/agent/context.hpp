#pragma once

#include "tai/agent/history.hpp"
#include "tai/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tai::agent {

struct ContextFile {
  std::string name;
  std::string content;
};

struct ContextLoad {
  std::vector<ContextFile> files;
  std::vector<std::string> warnings;
};

/// With `named` set, loads `<context_dir>/NAME.context.tai`; otherwise
/// `.context.tai` from `working_dir` ("local") or its git root ("project").
/// Every `global_contexts` entry that exists is appended as "global:NAME".
[[nodiscard]] common::Result<ContextLoad>
find_context_files(const std::filesystem::path &working_dir,
                   const std::optional<std::string> &named,
                   const std::vector<std::string> &global_contexts,
                   const std::filesystem::path &context_dir);

struct PromptInputs {
  std::string os_name;
  std::size_t max_words = 704;
  std::vector<ContextFile> contexts;
  std::vector<RelevantEntry> history;
};

[[nodiscard]] std::string build_system_prompt(const PromptInputs &inputs);

/// Name used in prompts and tool descriptions for the host OS.
[[nodiscard]] std::string host_os_name();

/// Answer length budget for a terminal with `rows` lines.
[[nodiscard]] std::size_t max_words_for_rows(std::size_t rows);

} // namespace tai::agent
