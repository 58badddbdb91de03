#include "tai/agent/context.hpp"

#include "tai/common/fs.hpp"

#include <sstream>

namespace tai::agent {

namespace {

constexpr const char *kContextFileName = ".context.tai";
constexpr const char *kContextSuffix = ".context.tai";

common::Status append_if_exists(const std::filesystem::path &file, const std::string &name,
                                std::vector<ContextFile> &out, bool &found) {
  found = false;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return common::Status::success();
  }
  auto content = common::read_text_file(file);
  if (!content.ok()) {
    return common::Status::error(content.kind(), content.error());
  }
  out.push_back(ContextFile{.name = name, .content = content.value()});
  found = true;
  return common::Status::success();
}

} // namespace

common::Result<ContextLoad> find_context_files(const std::filesystem::path &working_dir,
                                               const std::optional<std::string> &named,
                                               const std::vector<std::string> &global_contexts,
                                               const std::filesystem::path &context_dir) {
  ContextLoad load;
  bool found = false;

  if (named.has_value()) {
    const auto file = context_dir / (*named + kContextSuffix);
    if (auto status = append_if_exists(file, *named, load.files, found); !status.ok()) {
      return common::Result<ContextLoad>::failure(status.kind(), status.error());
    }
    if (!found) {
      load.warnings.push_back("Context '" + *named + "' not found");
    }
  } else {
    if (auto status = append_if_exists(working_dir / kContextFileName, "local", load.files, found);
        !status.ok()) {
      return common::Result<ContextLoad>::failure(status.kind(), status.error());
    }
    if (!found) {
      if (const auto git_root = common::find_git_root(working_dir); git_root.has_value()) {
        if (auto status =
                append_if_exists(*git_root / kContextFileName, "project", load.files, found);
            !status.ok()) {
          return common::Result<ContextLoad>::failure(status.kind(), status.error());
        }
      }
    }
  }

  for (const auto &global : global_contexts) {
    const auto file = context_dir / (global + kContextSuffix);
    if (auto status = append_if_exists(file, "global:" + global, load.files, found); !status.ok()) {
      return common::Result<ContextLoad>::failure(status.kind(), status.error());
    }
  }
  return common::Result<ContextLoad>::success(std::move(load));
}

std::string build_system_prompt(const PromptInputs &inputs) {
  std::ostringstream prompt;
  prompt << "You are an AI assistant running in a terminal that can call tools to operate on the "
            "user's machine.\n"
            "Your goal is to help the user achieve their task efficiently and safely.\n"
            "\n"
            "System rules:\n"
            "- If the user asks you to perform a terminal task, call the run_shell tool with the "
            "exact command to execute. Prefer pipes over multiple sequential commands when "
            "possible.\n"
            "- Keep commands non-interactive, idempotent, and safe by default. Avoid destructive "
            "operations unless the user explicitly requests them.\n"
         << "- The commands are being executed on " << inputs.os_name << ".\n"
         << "- When executing a terminal command the user can already see the output of the "
            "command. Do NOT summarize or restate the command's output.\n"
            "- If the user is asking about a command (explanatory), answer concisely and include "
            "a one-line example, then a brief explanation of key flags.\n"
            "- After running a command via the tool, use its output to decide next steps. You may "
            "call tools multiple times until the task is complete.\n"
            "- Do not invent file paths or secrets. Never print sensitive values.\n"
         << "- Keep your answer short and concise. Do not exceed " << inputs.max_words
         << " words!\n"
         << "- When you include code, always use fenced code blocks with a language identifier "
            "like ```rust, ```bash, ```python, etc. Avoid plain triple backticks without a "
            "language.\n"
            "- Always respond using Markdown syntax.\n"
            "\n";

  if (!inputs.contexts.empty()) {
    prompt << "\n## Additional Context\n\n";
    for (const auto &context : inputs.contexts) {
      prompt << "### Context from " << context.name << "\n\n" << context.content << "\n\n";
    }
  }

  if (!inputs.history.empty()) {
    prompt << "\nHere are some of your previous interactions (these may not be related to the "
              "current query and are just for reference):\n\n";
    for (std::size_t i = 0; i < inputs.history.size(); ++i) {
      const auto &item = inputs.history[i];
      prompt << "Interaction " << (i + 1) << " (from " << item.age_minutes << " minutes ago):\n"
             << "User: " << item.entry.user_input << "\n"
             << "Assistant: " << item.entry.llm_response << "\n\n";
    }
  }
  return prompt.str();
}

std::string host_os_name() {
#if defined(__APPLE__)
  return "Mac OS";
#elif defined(_WIN32)
  return "Windows";
#else
  return "Linux";
#endif
}

std::size_t max_words_for_rows(const std::size_t rows) {
  constexpr std::size_t kReservedRows = 6;
  constexpr std::size_t kWordsPerRow = 16;
  if (rows <= kReservedRows) {
    return kWordsPerRow;
  }
  return (rows - kReservedRows) * kWordsPerRow;
}

} // namespace tai::agent
