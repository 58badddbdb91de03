#include "tai/common/glob.hpp"

namespace tai::common {

namespace {

bool is_regex_special(const char ch) {
  switch (ch) {
  case '.':
  case '+':
  case '^':
  case '$':
  case '(':
  case ')':
  case '|':
  case '\\':
  case '{':
  case '}':
  case '[':
  case ']':
    return true;
  default:
    return false;
  }
}

std::string basename_of(const std::string &path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

Result<std::string> glob_to_regex(const std::string_view pattern) {
  std::string out = "^";
  out.reserve(pattern.size() * 2 + 2);
  std::size_t brace_depth = 0;

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    switch (ch) {
    case '*': {
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        const bool at_segment_start = i == 0 || pattern[i - 1] == '/';
        if (at_segment_start && i + 2 < pattern.size() && pattern[i + 2] == '/') {
          out += "(?:.*/)?";
          i += 2;
        } else if (at_segment_start && i + 2 == pattern.size() && i > 0) {
          // "dir/**": the directory itself and everything below it.
          out.pop_back();
          out += "(?:/.*)?";
          i += 1;
        } else {
          out += ".*";
          i += 1;
        }
      } else {
        out += "[^/]*";
      }
      break;
    }
    case '?':
      out += "[^/]";
      break;
    case '[': {
      const auto close = pattern.find(']', i + 2);
      if (close == std::string_view::npos) {
        out += "\\[";
        break;
      }
      out += '[';
      std::size_t j = i + 1;
      if (pattern[j] == '!' || pattern[j] == '^') {
        out += '^';
        ++j;
      }
      for (; j < close; ++j) {
        if (pattern[j] == '\\' || pattern[j] == '[' || pattern[j] == ']') {
          out += '\\';
        }
        out += pattern[j];
      }
      out += ']';
      i = close;
      break;
    }
    case '{':
      ++brace_depth;
      out += "(?:";
      break;
    case '}':
      if (brace_depth == 0) {
        out += "\\}";
      } else {
        --brace_depth;
        out += ')';
      }
      break;
    case ',':
      out += brace_depth > 0 ? '|' : ',';
      break;
    case '\\':
      if (i + 1 < pattern.size()) {
        ++i;
        if (is_regex_special(pattern[i]) || pattern[i] == '*' || pattern[i] == '?') {
          out += '\\';
        }
        out += pattern[i];
      } else {
        out += "\\\\";
      }
      break;
    default:
      if (is_regex_special(ch)) {
        out += '\\';
      }
      out += ch;
      break;
    }
  }

  if (brace_depth != 0) {
    return Result<std::string>::failure(ErrorKind::Validation,
                                        "Invalid glob '" + std::string(pattern) +
                                            "': unclosed '{'");
  }
  out += '$';
  return Result<std::string>::success(std::move(out));
}

GlobPattern::GlobPattern(std::string pattern, std::regex regex, const bool match_basename)
    : pattern_(std::move(pattern)), regex_(std::move(regex)), match_basename_(match_basename) {}

Result<GlobPattern> GlobPattern::compile(const std::string &pattern) {
  if (pattern.empty()) {
    return Result<GlobPattern>::failure(ErrorKind::Validation, "Glob pattern must not be empty");
  }
  auto translated = glob_to_regex(pattern);
  if (!translated.ok()) {
    return Result<GlobPattern>::failure(translated.kind(), translated.error());
  }
  try {
    std::regex regex(translated.value(), std::regex::ECMAScript | std::regex::optimize);
    const bool match_basename = pattern.find('/') == std::string::npos;
    return Result<GlobPattern>::success(GlobPattern(pattern, std::move(regex), match_basename));
  } catch (const std::regex_error &ex) {
    return Result<GlobPattern>::failure(ErrorKind::Validation,
                                        "Invalid glob '" + pattern + "': " + ex.what());
  }
}

bool GlobPattern::matches(const std::string &relative_path) const {
  if (std::regex_match(relative_path, regex_)) {
    return true;
  }
  return match_basename_ && std::regex_match(basename_of(relative_path), regex_);
}

Result<GlobSet> GlobSet::compile(const std::vector<std::string> &patterns) {
  GlobSet set;
  for (const auto &pattern : patterns) {
    auto compiled = GlobPattern::compile(pattern);
    if (!compiled.ok()) {
      return Result<GlobSet>::failure(compiled.kind(), compiled.error());
    }
    set.patterns_.push_back(std::move(compiled.value()));
  }
  return Result<GlobSet>::success(std::move(set));
}

bool GlobSet::matches(const std::string &relative_path) const {
  for (const auto &pattern : patterns_) {
    if (pattern.matches(relative_path)) {
      return true;
    }
  }
  return false;
}

} // namespace tai::common
