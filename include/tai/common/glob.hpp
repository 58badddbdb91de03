#pragma once

#include "tai/common/result.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tai::common {

/// Translate a shell glob to an ECMAScript regex anchored at both ends.
/// `*` and `?` stay within one path segment, `**` spans segments, `[...]` is a
/// character class (`[!...]` negated) and `{a,b}` is an alternation.
[[nodiscard]] Result<std::string> glob_to_regex(std::string_view pattern);

class GlobPattern {
public:
  [[nodiscard]] static Result<GlobPattern> compile(const std::string &pattern);

  /// `relative_path` uses '/' separators. Patterns without '/' also match the
  /// final path component on its own.
  [[nodiscard]] bool matches(const std::string &relative_path) const;
  [[nodiscard]] const std::string &pattern() const { return pattern_; }

private:
  GlobPattern(std::string pattern, std::regex regex, bool match_basename);

  std::string pattern_;
  std::regex regex_;
  bool match_basename_ = false;
};

class GlobSet {
public:
  [[nodiscard]] static Result<GlobSet> compile(const std::vector<std::string> &patterns);

  [[nodiscard]] bool empty() const { return patterns_.empty(); }
  [[nodiscard]] bool matches(const std::string &relative_path) const;

private:
  std::vector<GlobPattern> patterns_;
};

} // namespace tai::common
