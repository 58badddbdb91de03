#include "tai/tools/builtin/file_read.hpp"

#include "tai/common/fs.hpp"
#include "tai/tools/args.hpp"

#include <algorithm>
#include <sstream>

namespace tai::tools {

FileReadTool::FileReadTool(std::shared_ptr<security::PathSandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

std::string_view FileReadTool::name() const { return "read_file"; }

std::string_view FileReadTool::description() const {
  return "Read a text file with optional line offset and limit. Returns content and metadata.";
}

std::vector<ToolParameter> FileReadTool::parameters() const {
  return {
      {.name = "path",
       .type = "string",
       .description = "File path to read (relative to workspace)",
       .required = true},
      {.name = "offset", .type = "integer", .description = "Optional starting line (0-based)"},
      {.name = "limit", .type = "integer", .description = "Optional number of lines to return"},
  };
}

common::Result<std::string> FileReadTool::execute(const ToolArgs &args) {
  auto path_arg = required_string(args, "path");
  if (!path_arg.ok()) {
    return path_arg;
  }
  auto offset = u64_or(args, "offset", 0);
  if (!offset.ok()) {
    return common::Result<std::string>::failure(offset.kind(), offset.error());
  }
  const bool has_limit = has_arg(args, "limit");
  auto limit = u64_or(args, "limit", 0);
  if (!limit.ok()) {
    return common::Result<std::string>::failure(limit.kind(), limit.error());
  }

  auto resolved = sandbox_->resolve(path_arg.value(), false);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  const auto &path = resolved.value();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "Not a regular file: " + path.string());
  }
  if (common::looks_binary(path)) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "Binary file read is not allowed: " +
                                                    path.string());
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return content;
  }

  const auto lines = common::split_lines(content.value());
  const std::size_t total = lines.size();
  const std::size_t start = static_cast<std::size_t>(std::min<std::uint64_t>(offset.value(), total));
  std::size_t end = total;
  if (has_limit) {
    end = start + static_cast<std::size_t>(std::min<std::uint64_t>(limit.value(), total - start));
  }

  std::string slice;
  for (std::size_t i = start; i < end; ++i) {
    if (i > start) {
      slice.push_back('\n');
    }
    slice += lines[i];
  }

  std::ostringstream out;
  out << "{\"path\":" << common::json_quote(path.string()) << ",\"start\":" << start
      << ",\"end\":" << end << ",\"total_lines\":" << total
      << ",\"content\":" << common::json_quote(slice) << "}";
  return common::Result<std::string>::success(out.str());
}

std::string_view FileReadTool::group() const { return "fs"; }

} // namespace tai::tools
