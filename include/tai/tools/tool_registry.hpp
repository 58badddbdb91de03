#pragma once

#include "tai/common/http.hpp"
#include "tai/common/clipboard.hpp"
#include "tai/config/schema.hpp"
#include "tai/security/approval.hpp"
#include "tai/security/sandbox.hpp"
#include "tai/tools/tool.hpp"

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tai::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  /// Names are case-insensitive. Registering an existing name replaces that
  /// tool in place, keeping its catalog position.
  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

  /// Runs one call. Never fails: unknown tools, malformed arguments and tool
  /// errors all come back as an {"error": message} payload.
  [[nodiscard]] ToolResult dispatch(const ToolCall &call) const;

  [[nodiscard]] static ToolRegistry
  create_default(std::shared_ptr<security::PathSandbox> sandbox,
                 std::shared_ptr<security::ApprovalPrompt> approval,
                 std::shared_ptr<common::Clipboard> clipboard,
                 std::shared_ptr<common::HttpClient> http, const config::ToolsConfig &config);

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, std::size_t> by_name_;
};

} // namespace tai::tools
