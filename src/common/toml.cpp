#include "tai/common/toml.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace tai::common {

namespace {

Result<TomlValue> value_error(const std::string &message) {
  return Result<TomlValue>::failure(ErrorKind::Parse, message);
}

bool is_bare_key_char(const unsigned char ch) {
  return std::isalnum(ch) != 0 || ch == '_' || ch == '-';
}

// Dotted path of bare keys, e.g. "openai" or "history.path".
bool is_key_path(const std::string &key) {
  if (key.empty() || key.front() == '.' || key.back() == '.') {
    return false;
  }
  for (std::size_t i = 0; i < key.size(); ++i) {
    const auto ch = static_cast<unsigned char>(key[i]);
    if (ch == '.') {
      if (key[i - 1] == '.') {
        return false;
      }
      continue;
    }
    if (!is_bare_key_char(ch)) {
      return false;
    }
  }
  return true;
}

// One past the closing quote of the string opening at `pos`; npos when unterminated.
std::size_t string_end(const std::string &text, const std::size_t pos) {
  const char quote = text[pos];
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    if (quote == '"' && text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == quote) {
      return i + 1;
    }
  }
  return std::string::npos;
}

Result<std::string> strip_comment(const std::string &line) {
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"' || line[i] == '\'') {
      const std::size_t end = string_end(line, i);
      if (end == std::string::npos) {
        return Result<std::string>::failure(ErrorKind::Parse, "unterminated string");
      }
      i = end - 1;
      continue;
    }
    if (line[i] == '#') {
      return Result<std::string>::success(line.substr(0, i));
    }
  }
  return Result<std::string>::success(line);
}

Result<std::string> decode_string(const std::string &token) {
  if (token.empty() || string_end(token, 0) != token.size()) {
    return Result<std::string>::failure(ErrorKind::Parse, "malformed string " + token);
  }
  if (token.front() == '\'') {
    return Result<std::string>::success(token.substr(1, token.size() - 2));
  }
  // Basic strings use the same escapes as JSON.
  auto decoded = json_decode_string(token);
  if (!decoded.ok()) {
    return Result<std::string>::failure(ErrorKind::Parse, "malformed string " + token);
  }
  return decoded;
}

// Drops digit separators. An underscore must sit between two digits.
std::optional<std::string> without_separators(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '_') {
      out.push_back(text[i]);
      continue;
    }
    if (i == 0 || i + 1 >= text.size() ||
        std::isdigit(static_cast<unsigned char>(text[i - 1])) == 0 ||
        std::isdigit(static_cast<unsigned char>(text[i + 1])) == 0) {
      return std::nullopt;
    }
  }
  return out;
}

std::optional<std::int64_t> parse_integer(const std::string &text) {
  auto digits = without_separators(text);
  if (!digits.has_value()) {
    return std::nullopt;
  }
  if (!digits->empty() && digits->front() == '+') {
    digits->erase(0, 1);
  }
  if (digits->empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto *first = digits->data();
  const auto *last = first + digits->size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_float(const std::string &text) {
  const auto cleaned = without_separators(text);
  if (!cleaned.has_value() || cleaned->find_first_of(".eE") == std::string::npos) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(cleaned->c_str(), &end);
  if (end != cleaned->c_str() + cleaned->size()) {
    return std::nullopt;
  }
  return value;
}

Result<std::vector<std::string>> parse_string_array(const std::string &text) {
  using ResultT = Result<std::vector<std::string>>;
  const std::string body = text.substr(1, text.size() - 2);
  std::vector<std::string> items;
  std::size_t pos = 0;
  const auto skip_ws = [&] {
    while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos])) != 0) {
      ++pos;
    }
  };

  while (true) {
    skip_ws();
    if (pos >= body.size()) {
      break;
    }
    if (body[pos] != '"' && body[pos] != '\'') {
      return ResultT::failure(ErrorKind::Parse, "arrays may only contain strings");
    }
    const std::size_t end = string_end(body, pos);
    if (end == std::string::npos) {
      return ResultT::failure(ErrorKind::Parse, "unterminated string in array");
    }
    auto item = decode_string(body.substr(pos, end - pos));
    if (!item.ok()) {
      return ResultT::failure(item.kind(), item.error());
    }
    items.push_back(std::move(item.value()));
    pos = end;
    skip_ws();
    if (pos >= body.size()) {
      break;
    }
    if (body[pos] != ',') {
      return ResultT::failure(ErrorKind::Parse, "expected ',' between array items");
    }
    ++pos;
  }
  return ResultT::success(std::move(items));
}

std::string type_mismatch(const std::string &key, const TomlValue &value,
                          const std::string &expected) {
  std::string prefix;
  if (value.line > 0) {
    prefix = "line " + std::to_string(value.line) + ": ";
  }
  return prefix + "'" + key + "' must be " + expected + ", found " + value.raw;
}

Result<const TomlValue *> lookup(const TomlDocument &doc, const std::string &key) {
  const TomlValue *value = doc.find(key);
  if (value == nullptr) {
    return Result<const TomlValue *>::failure(ErrorKind::Validation, "missing key '" + key + "'");
  }
  return Result<const TomlValue *>::success(value);
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return entries_.contains(key); }

const TomlValue *TomlDocument::find(const std::string &key) const {
  const auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

void TomlDocument::set(const std::string &key, TomlValue value) {
  entries_[key] = std::move(value);
}

Result<std::string> TomlDocument::string_at(const std::string &key) const {
  auto value = lookup(*this, key);
  if (!value.ok()) {
    return Result<std::string>::failure(value.kind(), value.error());
  }
  if (value.value()->type != TomlType::String) {
    return Result<std::string>::failure(ErrorKind::Validation,
                                        type_mismatch(key, *value.value(), "a string"));
  }
  return Result<std::string>::success(value.value()->text);
}

Result<std::uint64_t> TomlDocument::u64_at(const std::string &key) const {
  auto value = lookup(*this, key);
  if (!value.ok()) {
    return Result<std::uint64_t>::failure(value.kind(), value.error());
  }
  const TomlValue &found = *value.value();
  if (found.type != TomlType::Integer || found.integer < 0) {
    return Result<std::uint64_t>::failure(ErrorKind::Validation,
                                          type_mismatch(key, found, "a non-negative integer"));
  }
  return Result<std::uint64_t>::success(static_cast<std::uint64_t>(found.integer));
}

Result<double> TomlDocument::number_at(const std::string &key) const {
  auto value = lookup(*this, key);
  if (!value.ok()) {
    return Result<double>::failure(value.kind(), value.error());
  }
  const TomlValue &found = *value.value();
  if (found.type != TomlType::Integer && found.type != TomlType::Float) {
    return Result<double>::failure(ErrorKind::Validation, type_mismatch(key, found, "a number"));
  }
  return Result<double>::success(found.number);
}

Result<std::vector<std::string>> TomlDocument::string_array_at(const std::string &key) const {
  using ResultT = Result<std::vector<std::string>>;
  auto value = lookup(*this, key);
  if (!value.ok()) {
    return ResultT::failure(value.kind(), value.error());
  }
  if (value.value()->type != TomlType::StringArray) {
    return ResultT::failure(ErrorKind::Validation,
                            type_mismatch(key, *value.value(), "an array of strings"));
  }
  return ResultT::success(value.value()->items);
}

Result<TomlValue> parse_toml_value(const std::string &text) {
  TomlValue out;
  out.raw = trim(text);
  const std::string &value = out.raw;
  if (value.empty()) {
    return value_error("missing value");
  }

  if (value.front() == '"' || value.front() == '\'') {
    auto decoded = decode_string(value);
    if (!decoded.ok()) {
      return value_error(decoded.error());
    }
    out.type = TomlType::String;
    out.text = std::move(decoded.value());
    return Result<TomlValue>::success(std::move(out));
  }

  if (value.front() == '[') {
    if (value.back() != ']') {
      return value_error("unterminated array");
    }
    auto items = parse_string_array(value);
    if (!items.ok()) {
      return value_error(items.error());
    }
    out.type = TomlType::StringArray;
    out.items = std::move(items.value());
    return Result<TomlValue>::success(std::move(out));
  }

  if (value == "true" || value == "false") {
    out.type = TomlType::Boolean;
    out.boolean = value == "true";
    return Result<TomlValue>::success(std::move(out));
  }

  if (const auto integer = parse_integer(value); integer.has_value()) {
    out.type = TomlType::Integer;
    out.integer = *integer;
    out.number = static_cast<double>(*integer);
    return Result<TomlValue>::success(std::move(out));
  }

  if (const auto number = parse_float(value); number.has_value()) {
    out.type = TomlType::Float;
    out.number = *number;
    return Result<TomlValue>::success(std::move(out));
  }

  return value_error("unsupported value " + value);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string where = "line " + std::to_string(line_number) + ": ";
    auto stripped = strip_comment(line);
    if (!stripped.ok()) {
      return Result<TomlDocument>::failure(ErrorKind::Parse, where + stripped.error());
    }
    const std::string clean = trim(stripped.value());
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return Result<TomlDocument>::failure(ErrorKind::Parse,
                                             where + "unterminated section header");
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (!is_key_path(section)) {
        return Result<TomlDocument>::failure(ErrorKind::Parse,
                                             where + "invalid section name '" + section + "'");
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorKind::Parse, where + "expected key = value");
    }
    const std::string key = trim(clean.substr(0, equals));
    if (!is_key_path(key)) {
      return Result<TomlDocument>::failure(ErrorKind::Parse,
                                           where + "invalid key '" + key + "'");
    }
    auto value = parse_toml_value(clean.substr(equals + 1));
    if (!value.ok()) {
      return Result<TomlDocument>::failure(ErrorKind::Parse, where + key + ": " + value.error());
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (document.has(full_key)) {
      return Result<TomlDocument>::failure(ErrorKind::Parse,
                                           where + "duplicate key '" + full_key + "'");
    }
    value.value().line = line_number;
    document.set(full_key, std::move(value.value()));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string render_toml(const TomlDocument &doc) {
  std::map<std::string, std::vector<std::pair<std::string, std::string>>> sections;
  for (const auto &[key, value] : doc.entries()) {
    const auto dot = key.rfind('.');
    if (dot == std::string::npos) {
      sections[""].emplace_back(key, value.raw);
    } else {
      sections[key.substr(0, dot)].emplace_back(key.substr(dot + 1), value.raw);
    }
  }

  std::ostringstream out;
  bool first = true;
  for (const auto &[section, entries] : sections) {
    if (!section.empty()) {
      if (!first) {
        out << "\n";
      }
      out << "[" << section << "]\n";
    }
    for (const auto &[key, raw] : entries) {
      out << key << " = " << raw << "\n";
    }
    first = false;
  }
  return out.str();
}

std::string quote_toml_string(const std::string &value) { return json_quote(value); }

} // namespace tai::common
