#include "tai/tools/builtin/file_write.hpp"

#include "tai/common/fs.hpp"
#include "tai/tools/args.hpp"

#include <sstream>

namespace tai::tools {

FileWriteTool::FileWriteTool(std::shared_ptr<security::PathSandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

std::string_view FileWriteTool::name() const { return "write_file"; }

std::string_view FileWriteTool::description() const {
  return "Write content to a file atomically. Creates parent directories if needed.";
}

std::vector<ToolParameter> FileWriteTool::parameters() const {
  return {
      {.name = "path",
       .type = "string",
       .description = "File path to write (relative to workspace)",
       .required = true},
      {.name = "content",
       .type = "string",
       .description = "Full file content to write",
       .required = true},
      {.name = "atomic", .type = "boolean", .description = "Write atomically (default true)"},
      {.name = "create_parents",
       .type = "boolean",
       .description = "Create parent directories if needed (default true)"},
  };
}

common::Result<std::string> FileWriteTool::execute(const ToolArgs &args) {
  auto path_arg = required_string(args, "path");
  if (!path_arg.ok()) {
    return path_arg;
  }
  auto content = required_string(args, "content");
  if (!content.ok()) {
    return content;
  }
  auto atomic = bool_or(args, "atomic", true);
  if (!atomic.ok()) {
    return common::Result<std::string>::failure(atomic.kind(), atomic.error());
  }
  auto create_parents = bool_or(args, "create_parents", true);
  if (!create_parents.ok()) {
    return common::Result<std::string>::failure(create_parents.kind(), create_parents.error());
  }

  auto resolved = create_parents.value() ? sandbox_->resolve_for_create(path_arg.value())
                                         : sandbox_->resolve(path_arg.value(), true);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  const auto &path = resolved.value();

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "Path is a directory: " + path.string());
  }
  if (create_parents.value() && !path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Result<std::string>::failure(dir.kind(), dir.error());
    }
  }

  const auto written = atomic.value() ? common::write_file_atomic(path, content.value())
                                      : common::write_file_direct(path, content.value());
  if (!written.ok()) {
    return common::Result<std::string>::failure(written.kind(), written.error());
  }

  std::ostringstream out;
  out << "{\"path\":" << common::json_quote(path.string())
      << ",\"bytes\":" << content.value().size() << "}";
  return common::Result<std::string>::success(out.str());
}

std::string_view FileWriteTool::group() const { return "fs"; }

} // namespace tai::tools
