#pragma once

#include "tai/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tai::tools {

/// JSON object {path,type,size,modified,created,mode} for one entry. A final
/// symlink is described itself, not its target. Timestamps are RFC 3339 UTC
/// seconds or null when the filesystem does not record them.
[[nodiscard]] common::Result<std::string> describe_path(const std::filesystem::path &path);

/// Entries of `dir` sorted by file name. Symlinks are listed, never followed.
[[nodiscard]] common::Result<std::vector<std::filesystem::directory_entry>>
sorted_children(const std::filesystem::path &dir);

/// '/'-separated path of `path` relative to `base`.
[[nodiscard]] std::string relative_slash_path(const std::filesystem::path &path,
                                              const std::filesystem::path &base);

} // namespace tai::tools
