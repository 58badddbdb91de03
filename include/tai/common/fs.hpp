#pragma once

#include "tai/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tai::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Nearest ancestor of `start` (inclusive) that contains a `.git` entry.
[[nodiscard]] std::optional<std::filesystem::path>
find_git_root(const std::filesystem::path &start);

/// Split text into lines on '\n'. A trailing '\r' is dropped from each line and a
/// final newline does not produce an empty trailing line.
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

/// True when the first `sample` bytes of the file contain a NUL byte.
[[nodiscard]] bool looks_binary(const std::filesystem::path &path, std::size_t sample = 8000);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Hex string of `bytes` cryptographically random bytes.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

/// Write through a uniquely named temporary sibling, fsync, then rename over `path`.
/// Readers observe either the previous content or `content`, never a mix.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Truncate and write `path` in place.
[[nodiscard]] Status write_file_direct(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace tai::common
