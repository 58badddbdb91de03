#include "tai/tools/builtin/stat.hpp"

#include "tai/tools/args.hpp"
#include "tai/tools/builtin/path_info.hpp"

namespace tai::tools {

StatTool::StatTool(std::shared_ptr<security::PathSandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

std::string_view StatTool::name() const { return "stat"; }

std::string_view StatTool::description() const {
  return "Get file or directory metadata (type, size, timestamps, mode).";
}

std::vector<ToolParameter> StatTool::parameters() const {
  return {
      {.name = "path", .type = "string", .description = "Path to inspect", .required = true},
  };
}

common::Result<std::string> StatTool::execute(const ToolArgs &args) {
  auto path_arg = required_string(args, "path");
  if (!path_arg.ok()) {
    return path_arg;
  }
  auto resolved = sandbox_->resolve(path_arg.value(), false);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  return describe_path(resolved.value());
}

std::string_view StatTool::group() const { return "fs"; }

} // namespace tai::tools
