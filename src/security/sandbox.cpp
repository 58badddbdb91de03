#include "tai/security/sandbox.hpp"

#include "tai/common/fs.hpp"

#include <deque>

namespace tai::security {

namespace {

using PathResult = common::Result<std::filesystem::path>;

bool entry_exists(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

PathResult escape_error(const std::string &input) {
  return PathResult::failure(common::ErrorKind::PathEscape,
                             "Path escapes workspace root: " + input);
}

} // namespace

PathSandbox::PathSandbox(std::filesystem::path root) : root_(std::move(root)) {}

common::Result<PathSandbox> PathSandbox::create(const std::filesystem::path &root) {
  std::error_code ec;
  auto canonical = std::filesystem::canonical(root, ec);
  if (ec) {
    return common::Result<PathSandbox>::failure(
        common::ErrorKind::Io, "Cannot resolve workspace root " + root.string() + ": " +
                                   ec.message());
  }
  if (!std::filesystem::is_directory(canonical, ec)) {
    return common::Result<PathSandbox>::failure(
        common::ErrorKind::Io, "Workspace root is not a directory: " + canonical.string());
  }
  return common::Result<PathSandbox>::success(PathSandbox(std::move(canonical)));
}

std::filesystem::path PathSandbox::absolute_input(const std::string &input) const {
  std::filesystem::path path(input);
  if (path.is_relative()) {
    path = root_ / path;
  }
  return path;
}

PathResult PathSandbox::contain(const std::filesystem::path &candidate,
                                const std::string &input) const {
  if (!common::is_subpath(candidate, root_)) {
    return escape_error(input);
  }
  return PathResult::success(candidate);
}

PathResult PathSandbox::resolve(const std::string &input, const bool allow_nonexistent) const {
  if (input.empty()) {
    return PathResult::failure(common::ErrorKind::Validation, "Path must not be empty");
  }
  const auto path = absolute_input(input);
  std::error_code ec;

  if (entry_exists(path)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
      // Dangling symlink: its target cannot be verified.
      return PathResult::failure(common::ErrorKind::Io,
                                 "Cannot resolve path " + input + ": " + ec.message());
    }
    return contain(canonical, input);
  }

  if (!allow_nonexistent) {
    const auto weak = std::filesystem::weakly_canonical(path, ec);
    if (!ec && !common::is_subpath(weak, root_)) {
      return escape_error(input);
    }
    return PathResult::failure(common::ErrorKind::Io, "Path does not exist: " + input);
  }

  const auto leaf = path.filename();
  if (leaf.empty() || leaf == "." || leaf == "..") {
    return PathResult::failure(common::ErrorKind::Validation,
                               "Path must name a file: " + input);
  }
  auto parent = std::filesystem::canonical(path.parent_path(), ec);
  if (ec) {
    const auto weak = std::filesystem::weakly_canonical(path.parent_path(), ec);
    if (!ec && !common::is_subpath(weak, root_)) {
      return escape_error(input);
    }
    return PathResult::failure(common::ErrorKind::Io,
                               "Parent directory does not exist: " +
                                   path.parent_path().string());
  }
  return contain(parent / leaf, input);
}

PathResult PathSandbox::resolve_for_create(const std::string &input) const {
  if (input.empty()) {
    return PathResult::failure(common::ErrorKind::Validation, "Path must not be empty");
  }
  const auto path = absolute_input(input);
  if (entry_exists(path) || entry_exists(path.parent_path())) {
    return resolve(input, true);
  }

  std::deque<std::filesystem::path> missing;
  std::filesystem::path existing = path;
  while (!existing.empty() && !entry_exists(existing)) {
    missing.push_front(existing.filename());
    const auto parent = existing.parent_path();
    if (parent == existing) {
      break;
    }
    existing = parent;
  }

  for (const auto &component : missing) {
    if (component.empty() || component == "." || component == "..") {
      return PathResult::failure(common::ErrorKind::Validation,
                                 "Path has a relative component inside missing directories: " +
                                     input);
    }
  }

  std::error_code ec;
  auto anchor = std::filesystem::canonical(existing, ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::Io,
                               "Cannot resolve path " + existing.string() + ": " + ec.message());
  }
  if (!common::is_subpath(anchor, root_)) {
    return escape_error(input);
  }
  for (const auto &component : missing) {
    anchor /= component;
  }
  return PathResult::success(anchor);
}

std::string PathSandbox::relative(const std::filesystem::path &resolved) const {
  const auto rel = resolved.lexically_relative(root_);
  if (rel.empty()) {
    return resolved.generic_string();
  }
  return rel.generic_string();
}

} // namespace tai::security
