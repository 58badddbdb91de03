#include "tai/agent/tool_display.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <sstream>
#include <string_view>

namespace tai::agent {

namespace {

constexpr std::size_t kValueChars = 160;
constexpr std::size_t kArrayItemChars = 60;
constexpr std::size_t kInlineArrayItems = 5;

constexpr std::array<std::string_view, 13> kSensitiveHints = {
    "key",    "token",      "secret", "password", "passwd",  "auth",  "authorization",
    "cookie", "api_key",    "apikey", "access_key", "session", "bearer"};

bool is_scalar(const std::string &raw) {
  return !raw.empty() && raw.front() != '[' && raw.front() != '{';
}

std::string render_scalar(const std::string &raw, const std::size_t max_chars, const bool quote) {
  if (common::json_is_string(raw)) {
    auto decoded = common::json_decode_string(raw);
    const std::string text = truncate_chars(decoded.ok() ? decoded.value() : raw, max_chars);
    return quote ? "\"" + text + "\"" : text;
  }
  return raw;
}

std::string render_value(const std::string &key, const std::string &raw) {
  if (is_sensitive_key(key)) {
    return "***";
  }
  if (raw.empty()) {
    return raw;
  }
  if (raw.front() == '{') {
    auto fields = common::json_parse_object(raw);
    return "{" + std::to_string(fields.ok() ? fields.value().size() : 0) + " keys}";
  }
  if (raw.front() == '[') {
    auto items = common::json_parse_array(raw);
    if (!items.ok()) {
      return raw;
    }
    const auto &values = items.value();
    if (values.empty()) {
      return "[]";
    }
    if (values.size() <= kInlineArrayItems && std::all_of(values.begin(), values.end(), is_scalar)) {
      std::string out = "[";
      for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += render_scalar(values[i], kArrayItemChars, true);
      }
      return out + "]";
    }
    return "[" + std::to_string(values.size()) + " items]";
  }
  return render_scalar(raw, kValueChars, false);
}

} // namespace

bool is_sensitive_key(const std::string &key) {
  const std::string lowered = common::to_lower(key);
  return std::any_of(kSensitiveHints.begin(), kSensitiveHints.end(), [&](std::string_view hint) {
    return lowered.find(hint) != std::string::npos;
  });
}

std::string truncate_chars(const std::string &text, const std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0U) == 0x80U) {
      continue;
    }
    if (chars == max_chars) {
      return text.substr(0, i) + "…";
    }
    ++chars;
  }
  return text;
}

std::string format_tool_params(const std::string &raw_arguments) {
  auto parsed = common::json_parse_object(common::trim(raw_arguments));
  if (!parsed.ok()) {
    return raw_arguments;
  }

  const std::map<std::string, std::string> sorted(parsed.value().begin(), parsed.value().end());
  std::ostringstream out;
  for (const auto &[key, raw] : sorted) {
    if (!raw.empty() && raw.front() == '{' && !is_sensitive_key(key)) {
      auto nested = common::json_parse_object(raw);
      if (nested.ok()) {
        out << "  " << key << ":\n";
        const std::map<std::string, std::string> nested_sorted(nested.value().begin(),
                                                                nested.value().end());
        for (const auto &[sub_key, sub_raw] : nested_sorted) {
          out << "    " << sub_key << ": " << render_value(sub_key, sub_raw) << "\n";
        }
        continue;
      }
    }
    out << "  " << key << ": " << render_value(key, raw) << "\n";
  }
  return out.str();
}

} // namespace tai::agent
