#pragma once

#include <string>

namespace tai::agent {

/// True when the lower-cased key contains a credential hint such as "token" or "auth".
[[nodiscard]] bool is_sensitive_key(const std::string &key);

/// Cut to `max_chars` UTF-8 characters, appending "…" when anything was dropped.
[[nodiscard]] std::string truncate_chars(const std::string &text, std::size_t max_chars);

/// Operator-facing rendering of a call's raw JSON arguments: one "  key: value"
/// line per sorted key, nested objects expanded one level, secrets masked.
/// Input that is not a JSON object is returned unchanged.
[[nodiscard]] std::string format_tool_params(const std::string &raw_arguments);

} // namespace tai::agent
