#pragma once

#include "tai/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace tai::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// json_escape wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX sequences.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Top-level members of a JSON object. Values are kept as raw JSON text
/// (a string value keeps its quotes) so callers can tell types apart.
using JsonFields = std::unordered_map<std::string, std::string>;

/// Strictly parse a JSON object. Trailing non-whitespace is an error.
[[nodiscard]] Result<JsonFields> json_parse_object(const std::string &json);

/// Strictly parse a JSON array into raw element texts.
[[nodiscard]] Result<std::vector<std::string>> json_parse_array(const std::string &json);

/// Decode a raw JSON string literal ("...") into its value.
[[nodiscard]] Result<std::string> json_decode_string(const std::string &raw);

[[nodiscard]] bool json_is_string(const std::string &raw);
[[nodiscard]] bool json_is_null(const std::string &raw);

/// Lookup helper for JsonFields: the decoded string value of `key`, or `fallback`
/// when missing or not a string.
[[nodiscard]] std::string json_field_string(const JsonFields &fields, const std::string &key,
                                            const std::string &fallback = "");

} // namespace tai::common
