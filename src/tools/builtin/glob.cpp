#include "tai/tools/builtin/glob.hpp"

#include "tai/common/glob.hpp"
#include "tai/common/json_util.hpp"
#include "tai/tools/args.hpp"
#include "tai/tools/builtin/path_info.hpp"

#include <sstream>

namespace tai::tools {

namespace {

void walk(const std::filesystem::path &root, const std::filesystem::path &dir,
          const common::GlobPattern &pattern, const std::size_t limit,
          std::vector<std::string> &paths) {
  auto children = sorted_children(dir);
  if (!children.ok()) {
    // Unreadable directories are skipped like any other walk error.
    return;
  }
  for (const auto &entry : children.value()) {
    if (paths.size() >= limit) {
      return;
    }
    std::error_code ec;
    const auto &path = entry.path();
    if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
      if (path.filename() != ".git") {
        walk(root, path, pattern, limit, paths);
      }
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    if (pattern.matches(relative_slash_path(path, root))) {
      paths.push_back(path.string());
    }
  }
}

} // namespace

GlobTool::GlobTool(std::shared_ptr<security::PathSandbox> sandbox, const std::size_t default_limit)
    : sandbox_(std::move(sandbox)), default_limit_(default_limit) {}

std::string_view GlobTool::name() const { return "glob"; }

std::string_view GlobTool::description() const {
  return "Find files matching a glob pattern under a root directory.";
}

std::vector<ToolParameter> GlobTool::parameters() const {
  return {
      {.name = "pattern",
       .type = "string",
       .description = "Glob pattern, e.g. **/*.rs",
       .required = true},
      {.name = "root", .type = "string", .description = "Root directory (default '.')"},
      {.name = "limit", .type = "integer", .description = "Maximum results to return (default 200)"},
  };
}

common::Result<std::string> GlobTool::execute(const ToolArgs &args) {
  auto pattern_arg = required_string(args, "pattern");
  if (!pattern_arg.ok()) {
    return pattern_arg;
  }
  auto root_arg = string_or(args, "root", ".");
  if (!root_arg.ok()) {
    return root_arg;
  }
  auto limit = u64_or(args, "limit", default_limit_);
  if (!limit.ok()) {
    return common::Result<std::string>::failure(limit.kind(), limit.error());
  }
  auto pattern = common::GlobPattern::compile(pattern_arg.value());
  if (!pattern.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Invalid glob pattern: " + pattern.error());
  }

  auto resolved = sandbox_->resolve(root_arg.value(), false);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  const auto &root = resolved.value();
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "Not a directory: " + root.string());
  }

  std::vector<std::string> paths;
  walk(root, root, pattern.value(), static_cast<std::size_t>(limit.value()), paths);

  std::ostringstream out;
  out << "{\"root\":" << common::json_quote(root.string())
      << ",\"pattern\":" << common::json_quote(pattern_arg.value())
      << ",\"count\":" << paths.size() << ",\"paths\":[";
  for (std::size_t i = 0; i < paths.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(paths[i]);
  }
  out << "]}";
  return common::Result<std::string>::success(out.str());
}

std::string_view GlobTool::group() const { return "search"; }

} // namespace tai::tools
