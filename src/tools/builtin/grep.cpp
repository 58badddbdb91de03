#include "tai/tools/builtin/grep.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/glob.hpp"
#include "tai/common/ignore.hpp"
#include "tai/common/json_util.hpp"
#include "tai/tools/args.hpp"
#include "tai/tools/builtin/path_info.hpp"

#include <regex>
#include <sstream>

namespace tai::tools {

namespace {

constexpr std::size_t kBinarySampleBytes = 8000;
// std::regex matching recurses per character; longer lines (minified or
// generated files) are skipped and counted instead of risking the stack.
constexpr std::size_t kMaxSearchLineBytes = 2048;

struct GrepHit {
  std::string file;
  std::string abs_path;
  std::size_t line = 0;
  std::string match;
};

struct SearchState {
  std::filesystem::path root;
  std::regex regex;
  common::GlobSet includes;
  common::GlobSet excludes;
  std::size_t max_results = 0;
  common::IgnoreStack ignores;
  std::vector<GrepHit> hits;
  std::size_t skipped_long_lines = 0;
};

std::string escape_regex(const std::string &text) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(text.size() * 2);
  for (const char c : text) {
    if (special.find(c) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

void search_file(SearchState &state, const std::filesystem::path &path) {
  if (common::looks_binary(path, kBinarySampleBytes)) {
    return;
  }
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return;
  }
  // A file given as the root is reported by its own name.
  const std::string rel = path == state.root ? path.filename().string()
                                             : relative_slash_path(path, state.root);
  const auto lines = common::split_lines(content.value());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (state.hits.size() >= state.max_results) {
      return;
    }
    if (lines[i].size() > kMaxSearchLineBytes) {
      ++state.skipped_long_lines;
      continue;
    }
    if (std::regex_search(lines[i], state.regex)) {
      state.hits.push_back(GrepHit{.file = rel,
                                   .abs_path = path.string(),
                                   .line = i + 1,
                                   .match = lines[i]});
    }
  }
}

void walk(SearchState &state, const std::filesystem::path &dir) {
  auto children = sorted_children(dir);
  if (!children.ok()) {
    return;
  }
  state.ignores.enter(dir);
  for (const auto &entry : children.value()) {
    if (state.hits.size() >= state.max_results) {
      break;
    }
    std::error_code ec;
    const auto &path = entry.path();
    const bool is_dir = entry.is_directory(ec) && !entry.is_symlink(ec);
    if (is_dir && path.filename() == ".git") {
      continue;
    }
    if (state.ignores.is_ignored(path, is_dir)) {
      continue;
    }
    const std::string rel = relative_slash_path(path, state.root);
    if (!state.excludes.empty() && state.excludes.matches(rel)) {
      continue;
    }
    if (is_dir) {
      walk(state, path);
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    if (!state.includes.empty() && !state.includes.matches(rel)) {
      continue;
    }
    search_file(state, path);
  }
  state.ignores.leave();
}

} // namespace

GrepTool::GrepTool(std::shared_ptr<security::PathSandbox> sandbox,
                   const std::size_t default_max_results)
    : sandbox_(std::move(sandbox)), default_max_results_(default_max_results) {}

std::string_view GrepTool::name() const { return "grep"; }

std::string_view GrepTool::description() const {
  return "Search files for a regex or literal string, respecting .gitignore. Returns matching "
         "lines with file paths and line numbers.";
}

std::vector<ToolParameter> GrepTool::parameters() const {
  return {
      {.name = "pattern",
       .type = "string",
       .description = "Regex pattern (or literal if literal=true)",
       .required = true},
      {.name = "root", .type = "string", .description = "Root directory to search (default '.')"},
      {.name = "include_globs",
       .type = "array",
       .description = "Only search files matching any of these globs",
       .items_type = "string"},
      {.name = "exclude_globs",
       .type = "array",
       .description = "Skip paths matching any of these globs",
       .items_type = "string"},
      {.name = "literal", .type = "boolean", .description = "Treat pattern as a literal string"},
      {.name = "case_sensitive",
       .type = "boolean",
       .description = "Case sensitive match (default true)"},
      {.name = "max_results",
       .type = "integer",
       .description = "Maximum results to return (default 100)"},
  };
}

common::Result<std::string> GrepTool::execute(const ToolArgs &args) {
  auto pattern = required_string(args, "pattern");
  if (!pattern.ok()) {
    return pattern;
  }
  auto root_arg = string_or(args, "root", ".");
  if (!root_arg.ok()) {
    return root_arg;
  }
  auto literal = bool_or(args, "literal", false);
  if (!literal.ok()) {
    return common::Result<std::string>::failure(literal.kind(), literal.error());
  }
  auto case_sensitive = bool_or(args, "case_sensitive", true);
  if (!case_sensitive.ok()) {
    return common::Result<std::string>::failure(case_sensitive.kind(), case_sensitive.error());
  }
  auto max_results = u64_or(args, "max_results", default_max_results_);
  if (!max_results.ok()) {
    return common::Result<std::string>::failure(max_results.kind(), max_results.error());
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

  auto flags = std::regex::ECMAScript;
  if (!case_sensitive.value()) {
    flags |= std::regex::icase;
  }
  std::regex regex;
  try {
    regex = std::regex(literal.value() ? escape_regex(pattern.value()) : pattern.value(), flags);
  } catch (const std::regex_error &err) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                std::string("Invalid regex pattern: ") +
                                                    err.what());
  }

  auto resolved = sandbox_->resolve(root_arg.value(), false);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  const auto &root = resolved.value();

  SearchState state{.root = root,
                    .regex = std::move(regex),
                    .includes = std::move(includes.value()),
                    .excludes = std::move(excludes.value()),
                    .max_results = static_cast<std::size_t>(max_results.value()),
                    .ignores = common::IgnoreStack(root),
                    .hits = {},
                    .skipped_long_lines = 0};
  std::error_code ec;
  if (std::filesystem::is_directory(root, ec)) {
    walk(state, root);
  } else {
    search_file(state, root);
  }

  std::ostringstream out;
  out << "{\"root\":" << common::json_quote(root.string())
      << ",\"pattern\":" << common::json_quote(pattern.value())
      << ",\"count\":" << state.hits.size()
      << ",\"skipped_long_lines\":" << state.skipped_long_lines << ",\"results\":[";
  for (std::size_t i = 0; i < state.hits.size(); ++i) {
    const auto &hit = state.hits[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"file\":" << common::json_quote(hit.file)
        << ",\"abs_path\":" << common::json_quote(hit.abs_path) << ",\"line\":" << hit.line
        << ",\"match\":" << common::json_quote(hit.match) << "}";
  }
  out << "]}";
  return common::Result<std::string>::success(out.str());
}

std::string_view GrepTool::group() const { return "search"; }

} // namespace tai::tools
