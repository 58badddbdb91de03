#include "tai/tools/tool_registry.hpp"

#include "tai/common/fs.hpp"
#include "tai/observability/global.hpp"
#include "tai/tools/builtin/fetch_url.hpp"
#include "tai/tools/builtin/file_patch.hpp"
#include "tai/tools/builtin/file_read.hpp"
#include "tai/tools/builtin/file_write.hpp"
#include "tai/tools/builtin/glob.hpp"
#include "tai/tools/builtin/grep.hpp"
#include "tai/tools/builtin/list_dir.hpp"
#include "tai/tools/builtin/shell.hpp"
#include "tai/tools/builtin/stat.hpp"

#include <chrono>
#include <exception>

namespace tai::tools {

namespace {

ToolResult failed(const ToolCall &call, const std::string &message) {
  return ToolResult{
      .id = call.id, .name = call.name, .payload = error_payload(message), .success = false};
}

} // namespace

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  const std::string key = common::to_lower(std::string(tool->name()));
  if (const auto it = by_name_.find(key); it != by_name_.end()) {
    tools_[it->second] = std::move(tool);
    return;
  }
  by_name_[key] = tools_.size();
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return tools_[it->second].get();
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

ToolResult ToolRegistry::dispatch(const ToolCall &call) const {
  ITool *tool = get_tool(call.name);
  if (tool == nullptr) {
    return failed(call, "Unknown tool: " + call.name);
  }

  const std::string raw = common::trim(call.arguments);
  auto parsed = common::json_parse_object(raw.empty() ? "{}" : raw);
  if (!parsed.ok()) {
    return failed(call, "Failed parsing tool args for " + call.name + ": " + parsed.error());
  }
  ToolArgs args = std::move(parsed.value());
  std::erase_if(args, [](const auto &entry) { return common::json_is_null(entry.second); });

  for (const auto &param : tool->parameters()) {
    if (param.required && args.find(param.name) == args.end()) {
      return failed(call, "Missing required argument: " + param.name);
    }
  }

  const auto started = std::chrono::steady_clock::now();
  common::Result<std::string> result = common::Result<std::string>::failure("");
  try {
    result = tool->execute(args);
  } catch (const std::exception &ex) {
    result = common::Result<std::string>::failure(std::string(tool->name()) +
                                                  " failed: " + ex.what());
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_tool_call(std::string(tool->name()), elapsed, result.ok());

  if (!result.ok()) {
    return failed(call, result.error());
  }
  return ToolResult{.id = call.id, .name = call.name, .payload = result.value(), .success = true};
}

ToolRegistry ToolRegistry::create_default(std::shared_ptr<security::PathSandbox> sandbox,
                                          std::shared_ptr<security::ApprovalPrompt> approval,
                                          std::shared_ptr<common::Clipboard> clipboard,
                                          std::shared_ptr<common::HttpClient> http,
                                          const config::ToolsConfig &config) {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<FileReadTool>(sandbox));
  registry.register_tool(std::make_unique<FileWriteTool>(sandbox));
  registry.register_tool(std::make_unique<FilePatchTool>(sandbox));
  registry.register_tool(std::make_unique<ListDirTool>(sandbox, config.list_limit));
  registry.register_tool(std::make_unique<StatTool>(sandbox));
  registry.register_tool(std::make_unique<GlobTool>(sandbox, config.glob_limit));
  registry.register_tool(std::make_unique<GrepTool>(sandbox, config.grep_max_results));
  registry.register_tool(std::make_unique<ShellTool>(sandbox, std::move(approval),
                                                     std::move(clipboard),
                                                     config.shell_timeout_sec));
  registry.register_tool(std::make_unique<FetchUrlTool>(std::move(http), config.fetch_timeout_sec,
                                                        config.fetch_max_bytes));
  return registry;
}

} // namespace tai::tools
