#include "tai/tools/builtin/list_dir.hpp"

#include "tai/common/glob.hpp"
#include "tai/common/json_util.hpp"
#include "tai/tools/args.hpp"
#include "tai/tools/builtin/path_info.hpp"

#include <sstream>

namespace tai::tools {

namespace {

struct ListOptions {
  bool recursive = false;
  bool include_hidden = false;
  std::size_t limit = 0;
  common::GlobSet includes;
  common::GlobSet excludes;
};

bool is_hidden(const std::filesystem::path &path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

common::Status collect(const std::filesystem::path &root, const std::filesystem::path &dir,
                       const ListOptions &options, std::vector<std::string> &items) {
  auto children = sorted_children(dir);
  if (!children.ok()) {
    return common::Status::error(children.kind(), children.error());
  }

  for (const auto &entry : children.value()) {
    if (items.size() >= options.limit) {
      return common::Status::success();
    }
    const auto &path = entry.path();
    if (!options.include_hidden && is_hidden(path)) {
      continue;
    }
    const std::string rel = relative_slash_path(path, root);
    if (!options.excludes.empty() && options.excludes.matches(rel)) {
      continue;
    }

    if (options.includes.empty() || options.includes.matches(rel)) {
      auto info = describe_path(path);
      if (!info.ok()) {
        return common::Status::error(info.kind(), info.error());
      }
      items.push_back(info.value());
    }

    std::error_code ec;
    if (options.recursive && entry.is_directory(ec) && !entry.is_symlink(ec)) {
      if (auto status = collect(root, path, options, items); !status.ok()) {
        return status;
      }
    }
  }
  return common::Status::success();
}

} // namespace

ListDirTool::ListDirTool(std::shared_ptr<security::PathSandbox> sandbox,
                         const std::size_t default_limit)
    : sandbox_(std::move(sandbox)), default_limit_(default_limit) {}

std::string_view ListDirTool::name() const { return "list_dir"; }

std::string_view ListDirTool::description() const {
  return "List directory entries with optional recursion, glob filters, and metadata.";
}

std::vector<ToolParameter> ListDirTool::parameters() const {
  return {
      {.name = "path", .type = "string", .description = "Directory to list (default '.')"},
      {.name = "recursive", .type = "boolean", .description = "Recurse into subdirectories"},
      {.name = "include_globs",
       .type = "array",
       .description = "Only include entries matching any of these globs",
       .items_type = "string"},
      {.name = "exclude_globs",
       .type = "array",
       .description = "Exclude entries matching any of these globs",
       .items_type = "string"},
      {.name = "limit", .type = "integer", .description = "Maximum entries to return (default 1000)"},
      {.name = "include_hidden",
       .type = "boolean",
       .description = "Include dotfiles (default false)"},
  };
}

common::Result<std::string> ListDirTool::execute(const ToolArgs &args) {
  auto path_arg = string_or(args, "path", ".");
  if (!path_arg.ok()) {
    return path_arg;
  }
  auto recursive = bool_or(args, "recursive", false);
  if (!recursive.ok()) {
    return common::Result<std::string>::failure(recursive.kind(), recursive.error());
  }
  auto include_hidden = bool_or(args, "include_hidden", false);
  if (!include_hidden.ok()) {
    return common::Result<std::string>::failure(include_hidden.kind(), include_hidden.error());
  }
  auto limit = u64_or(args, "limit", default_limit_);
  if (!limit.ok()) {
    return common::Result<std::string>::failure(limit.kind(), limit.error());
  }
  auto include_list = string_list(args, "include_globs");
  if (!include_list.ok()) {
    return common::Result<std::string>::failure(include_list.kind(), include_list.error());
  }
  auto exclude_list = string_list(args, "exclude_globs");
  if (!exclude_list.ok()) {
    return common::Result<std::string>::failure(exclude_list.kind(), exclude_list.error());
  }
  auto includes = common::GlobSet::compile(include_list.value());
  if (!includes.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "bad include glob: " + includes.error());
  }
  auto excludes = common::GlobSet::compile(exclude_list.value());
  if (!excludes.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "bad exclude glob: " + excludes.error());
  }

  auto resolved = sandbox_->resolve(path_arg.value(), false);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  const auto &dir = resolved.value();
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "Not a directory: " + dir.string());
  }

  const ListOptions options{.recursive = recursive.value(),
                            .include_hidden = include_hidden.value(),
                            .limit = static_cast<std::size_t>(limit.value()),
                            .includes = std::move(includes.value()),
                            .excludes = std::move(excludes.value())};
  std::vector<std::string> items;
  if (auto status = collect(dir, dir, options, items); !status.ok()) {
    return common::Result<std::string>::failure(status.kind(), status.error());
  }

  std::ostringstream out;
  out << "{\"path\":" << common::json_quote(dir.string()) << ",\"count\":" << items.size()
      << ",\"items\":[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << items[i];
  }
  out << "]}";
  return common::Result<std::string>::success(out.str());
}

std::string_view ListDirTool::group() const { return "fs"; }

} // namespace tai::tools
