#pragma once

#include "tai/common/result.hpp"
#include "tai/tools/tool.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tai::tools {

// Argument accessors. A key holding JSON null counts as absent; a value of the
// wrong type is a Validation error naming the key.

[[nodiscard]] bool has_arg(const ToolArgs &args, const std::string &key);

[[nodiscard]] common::Result<std::string> required_string(const ToolArgs &args,
                                                          const std::string &key);
[[nodiscard]] common::Result<std::string> string_or(const ToolArgs &args, const std::string &key,
                                                    const std::string &fallback);
/// Accepts JSON integers or digit strings.
[[nodiscard]] common::Result<std::uint64_t> u64_or(const ToolArgs &args, const std::string &key,
                                                   std::uint64_t fallback);
/// u64_or restricted to [min, max]; out-of-range values are Validation errors.
[[nodiscard]] common::Result<std::uint64_t> u64_in_range(const ToolArgs &args,
                                                         const std::string &key,
                                                         std::uint64_t fallback, std::uint64_t min,
                                                         std::uint64_t max);
/// Accepts JSON booleans or "true"/"false".
[[nodiscard]] common::Result<bool> bool_or(const ToolArgs &args, const std::string &key,
                                           bool fallback);
/// Accepts an array of strings; a single string becomes a one-element list.
[[nodiscard]] common::Result<std::vector<std::string>> string_list(const ToolArgs &args,
                                                                   const std::string &key);
/// Accepts an object of string values.
[[nodiscard]] common::Result<std::vector<std::pair<std::string, std::string>>>
string_map(const ToolArgs &args, const std::string &key);

} // namespace tai::tools
