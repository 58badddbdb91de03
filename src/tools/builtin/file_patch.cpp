#include "tai/tools/builtin/file_patch.hpp"

#include "tai/common/fs.hpp"
#include "tai/tools/args.hpp"

#include <numeric>
#include <sstream>

namespace tai::tools {

namespace {

struct Replacement {
  std::string old_string;
  std::string new_string;
  bool replace_all = false;
};

common::Result<std::vector<Replacement>> parse_replacements(const ToolArgs &args) {
  using ResultT = common::Result<std::vector<Replacement>>;
  const auto it = args.find("replacements");
  if (it == args.end() || common::json_is_null(it->second)) {
    return ResultT::failure(common::ErrorKind::Validation,
                            "Missing required argument: replacements");
  }
  auto elements = common::json_parse_array(it->second);
  if (!elements.ok()) {
    return ResultT::failure(common::ErrorKind::Parse,
                            "replacements must be an array: " + elements.error());
  }

  std::vector<Replacement> out;
  out.reserve(elements.value().size());
  for (std::size_t i = 0; i < elements.value().size(); ++i) {
    const std::string where = "replacement " + std::to_string(i);
    auto fields = common::json_parse_object(elements.value()[i]);
    if (!fields.ok()) {
      return ResultT::failure(common::ErrorKind::Parse, where + " must be an object");
    }
    auto old_string = required_string(fields.value(), "old_string");
    if (!old_string.ok()) {
      return ResultT::failure(old_string.kind(), where + ": " + old_string.error());
    }
    if (old_string.value().empty()) {
      return ResultT::failure(common::ErrorKind::Validation,
                              where + ": old_string cannot be empty");
    }
    auto new_string = required_string(fields.value(), "new_string");
    if (!new_string.ok()) {
      return ResultT::failure(new_string.kind(), where + ": " + new_string.error());
    }
    auto replace_all = bool_or(fields.value(), "replace_all", false);
    if (!replace_all.ok()) {
      return ResultT::failure(replace_all.kind(), where + ": " + replace_all.error());
    }
    out.push_back(Replacement{.old_string = old_string.value(),
                              .new_string = new_string.value(),
                              .replace_all = replace_all.value()});
  }
  return ResultT::success(std::move(out));
}

std::size_t apply_replacement(std::string &buffer, const Replacement &replacement) {
  if (!replacement.replace_all) {
    const auto pos = buffer.find(replacement.old_string);
    if (pos == std::string::npos) {
      return 0;
    }
    buffer.replace(pos, replacement.old_string.size(), replacement.new_string);
    return 1;
  }

  std::string result;
  result.reserve(buffer.size());
  std::size_t count = 0;
  std::size_t cursor = 0;
  while (true) {
    const auto pos = buffer.find(replacement.old_string, cursor);
    if (pos == std::string::npos) {
      break;
    }
    result.append(buffer, cursor, pos - cursor);
    result += replacement.new_string;
    cursor = pos + replacement.old_string.size();
    ++count;
  }
  result.append(buffer, cursor, std::string::npos);
  buffer = std::move(result);
  return count;
}

} // namespace

FilePatchTool::FilePatchTool(std::shared_ptr<security::PathSandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

std::string_view FilePatchTool::name() const { return "patch_file"; }

std::string_view FilePatchTool::description() const {
  return "Apply multiple string replacements to a file (transactional). Each replacement may be "
         "replace_all or single occurrence.";
}

std::vector<ToolParameter> FilePatchTool::parameters() const {
  return {
      {.name = "path", .type = "string", .description = "File path to patch", .required = true},
      {.name = "replacements",
       .type = "array",
       .description = "Array of {old_string,new_string,replace_all?}",
       .required = true,
       .items_type = "object"},
      {.name = "atomic", .type = "boolean", .description = "Apply atomically (default true)"},
  };
}

common::Result<std::string> FilePatchTool::execute(const ToolArgs &args) {
  auto path_arg = required_string(args, "path");
  if (!path_arg.ok()) {
    return path_arg;
  }
  auto replacements = parse_replacements(args);
  if (!replacements.ok()) {
    return common::Result<std::string>::failure(replacements.kind(), replacements.error());
  }
  auto atomic = bool_or(args, "atomic", true);
  if (!atomic.ok()) {
    return common::Result<std::string>::failure(atomic.kind(), atomic.error());
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
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return content;
  }

  // Every replacement runs against one in-memory candidate; disk is touched at most once.
  std::string updated = content.value();
  std::vector<std::size_t> counts;
  counts.reserve(replacements.value().size());
  for (const auto &replacement : replacements.value()) {
    counts.push_back(apply_replacement(updated, replacement));
  }
  const std::size_t total = std::accumulate(counts.begin(), counts.end(), std::size_t{0});
  const bool changed = updated != content.value();

  if (changed) {
    const auto written = atomic.value() ? common::write_file_atomic(path, updated)
                                        : common::write_file_direct(path, updated);
    if (!written.ok()) {
      return common::Result<std::string>::failure(written.kind(), written.error());
    }
  }

  std::ostringstream out;
  out << "{\"path\":" << common::json_quote(path.string())
      << ",\"changed\":" << (changed ? "true" : "false") << ",\"replacements\":[";
  for (std::size_t i = 0; i < counts.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << counts[i];
  }
  out << "],\"total_replacements\":" << total << "}";
  return common::Result<std::string>::success(out.str());
}

std::string_view FilePatchTool::group() const { return "fs"; }

} // namespace tai::tools
