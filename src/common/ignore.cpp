#include "tai/common/ignore.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/glob.hpp"

#include <fstream>
#include <sstream>

namespace tai::common {

namespace {

std::string generic_relative(const std::filesystem::path &path,
                             const std::filesystem::path &base) {
  return path.lexically_relative(base).generic_string();
}

std::string trim_trailing_spaces(std::string line) {
  while (!line.empty() && (line.back() == ' ' || line.back() == '\r')) {
    if (line.size() >= 2 && line[line.size() - 2] == '\\') {
      line.erase(line.size() - 2, 1);
      break;
    }
    line.pop_back();
  }
  return line;
}

} // namespace

IgnoreRules IgnoreRules::parse(const std::string &text) {
  IgnoreRules out;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    line = trim_trailing_spaces(line);
    if (line.empty() || line.front() == '#') {
      continue;
    }

    Rule rule;
    if (line.front() == '!') {
      rule.negated = true;
      line.erase(0, 1);
    } else if (starts_with(line, "\\!") || starts_with(line, "\\#")) {
      line.erase(0, 1);
    }
    if (!line.empty() && line.back() == '/') {
      rule.directory_only = true;
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    // A slash anywhere but the end anchors the pattern to the rules' directory.
    std::string pattern;
    if (line.front() == '/') {
      pattern = line.substr(1);
    } else if (line.find('/') != std::string::npos) {
      pattern = line;
    } else {
      pattern = "**/" + line;
    }

    auto translated = glob_to_regex(pattern);
    if (!translated.ok()) {
      continue;
    }
    try {
      rule.regex = std::regex(translated.value(), std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error &) {
      continue;
    }
    out.rules_.push_back(std::move(rule));
  }
  return out;
}

IgnoreRules IgnoreRules::load(const std::filesystem::path &file) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return {};
  }
  auto content = read_text_file(file);
  if (!content.ok()) {
    return {};
  }
  return parse(content.value());
}

std::optional<bool> IgnoreRules::match(const std::string &relative_path, const bool is_dir) const {
  std::optional<bool> decision;
  for (const auto &rule : rules_) {
    if (rule.directory_only && !is_dir) {
      continue;
    }
    if (std::regex_match(relative_path, rule.regex)) {
      decision = !rule.negated;
    }
  }
  return decision;
}

IgnoreStack::IgnoreStack(const std::filesystem::path &root) {
  auto exclude = IgnoreRules::load(root / ".git" / "info" / "exclude");
  if (!exclude.empty()) {
    levels_.push_back(Level{.base = root, .rules = std::move(exclude)});
  }
}

void IgnoreStack::enter(const std::filesystem::path &dir) {
  // Both files share one level so `.ignore` can override `.gitignore`.
  std::string combined;
  for (const char *name : {".gitignore", ".ignore"}) {
    std::error_code ec;
    const auto file = dir / name;
    if (!std::filesystem::is_regular_file(file, ec)) {
      continue;
    }
    if (auto content = read_text_file(file); content.ok()) {
      combined += content.value();
      combined += '\n';
    }
  }
  levels_.push_back(Level{.base = dir, .rules = IgnoreRules::parse(combined)});
}

void IgnoreStack::leave() {
  if (!levels_.empty()) {
    levels_.pop_back();
  }
}

bool IgnoreStack::is_ignored(const std::filesystem::path &path, const bool is_dir) const {
  bool ignored = false;
  for (const auto &level : levels_) {
    if (level.rules.empty()) {
      continue;
    }
    const std::string relative = generic_relative(path, level.base);
    if (relative.empty() || starts_with(relative, "..")) {
      continue;
    }
    if (const auto decision = level.rules.match(relative, is_dir); decision.has_value()) {
      ignored = *decision;
    }
  }
  return ignored;
}

} // namespace tai::common
