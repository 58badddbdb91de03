#pragma once

#include "tai/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tai::common {

enum class TomlType {
  String,
  Integer,
  Float,
  Boolean,
  StringArray,
};

/// One typed scalar or string array. `raw` keeps the TOML text so a document
/// can be written back without reformatting values.
struct TomlValue {
  TomlType type = TomlType::String;
  std::string raw;
  std::string text;
  std::int64_t integer = 0;
  double number = 0.0;
  bool boolean = false;
  std::vector<std::string> items;
  /// 1-based source line; zero for values set in code.
  std::size_t line = 0;
};

/// Keys inside `[section]` are stored as "section.key". The typed accessors
/// fail with ErrorKind::Validation naming the key and its line when the
/// stored value has another type.
class TomlDocument {
public:
  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] const TomlValue *find(const std::string &key) const;
  [[nodiscard]] const std::map<std::string, TomlValue> &entries() const { return entries_; }
  void set(const std::string &key, TomlValue value);

  [[nodiscard]] Result<std::string> string_at(const std::string &key) const;
  [[nodiscard]] Result<std::uint64_t> u64_at(const std::string &key) const;
  /// Integers are accepted where a number is expected.
  [[nodiscard]] Result<double> number_at(const std::string &key) const;
  [[nodiscard]] Result<std::vector<std::string>> string_array_at(const std::string &key) const;

private:
  std::map<std::string, TomlValue> entries_;
};

/// Parse the subset of TOML used by config files: `[section]` headers,
/// `key = value` pairs, basic and literal strings, integers, floats, booleans
/// and single-line string arrays. Errors are ErrorKind::Parse with the line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

/// Parse a single value as it would appear to the right of `=`.
[[nodiscard]] Result<TomlValue> parse_toml_value(const std::string &text);

/// Sections sorted by name, top-level keys first.
[[nodiscard]] std::string render_toml(const TomlDocument &doc);

[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace tai::common
