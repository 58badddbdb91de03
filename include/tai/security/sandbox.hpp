#pragma once

#include "tai/common/result.hpp"

#include <filesystem>
#include <string>

namespace tai::security {

/// Confines path arguments to a workspace root fixed at construction.
///
/// Every returned path is absolute, has symlinks resolved, and lies under
/// `root()`. Anything else fails with `ErrorKind::PathEscape`. Resolution only
/// reads the filesystem; it never creates or modifies entries.
class PathSandbox {
public:
  /// Canonicalizes `root`; fails if it does not exist or is not a directory.
  [[nodiscard]] static common::Result<PathSandbox> create(const std::filesystem::path &root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  /// Relative inputs are joined to the root. With `allow_nonexistent` only the
  /// parent directory has to exist; the final component is appended as given.
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &input,
                                                              bool allow_nonexistent) const;

  /// Like resolve(input, true) but tolerates missing intermediate directories.
  /// The deepest existing ancestor must be inside the root and the missing
  /// part may not contain "." or ".." components.
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_for_create(const std::string &input) const;

  /// Path relative to the root with '/' separators ("." for the root itself).
  [[nodiscard]] std::string relative(const std::filesystem::path &resolved) const;

private:
  explicit PathSandbox(std::filesystem::path root);

  [[nodiscard]] std::filesystem::path absolute_input(const std::string &input) const;
  [[nodiscard]] common::Result<std::filesystem::path>
  contain(const std::filesystem::path &candidate, const std::string &input) const;

  std::filesystem::path root_;
};

} // namespace tai::security
