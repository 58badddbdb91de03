#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace tai::common {

/// Rules from one gitignore-syntax file.
class IgnoreRules {
public:
  [[nodiscard]] static IgnoreRules parse(const std::string &text);
  /// A missing or unreadable file yields an empty rule set.
  [[nodiscard]] static IgnoreRules load(const std::filesystem::path &file);

  /// Decision of the last matching rule: true ignored, false re-included,
  /// nullopt when no rule matches. `relative_path` is relative to the
  /// directory holding the rules and uses '/' separators.
  [[nodiscard]] std::optional<bool> match(const std::string &relative_path, bool is_dir) const;
  [[nodiscard]] bool empty() const { return rules_.empty(); }

private:
  struct Rule {
    std::regex regex;
    bool negated = false;
    bool directory_only = false;
  };

  std::vector<Rule> rules_;
};

/// Hierarchical ignore state for a directory walk: `.gitignore` and `.ignore`
/// files of every entered directory, plus `.git/info/exclude` of the root.
class IgnoreStack {
public:
  explicit IgnoreStack(const std::filesystem::path &root);

  void enter(const std::filesystem::path &dir);
  void leave();

  [[nodiscard]] bool is_ignored(const std::filesystem::path &path, bool is_dir) const;

private:
  struct Level {
    std::filesystem::path base;
    IgnoreRules rules;
  };

  std::vector<Level> levels_;
};

} // namespace tai::common
