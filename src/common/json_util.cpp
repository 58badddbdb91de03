#include "tai/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string_view>

namespace tai::common {

namespace {

constexpr std::size_t kMaxDepth = 256;

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &text, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = text[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  out = value;
  return true;
}

// Strict scanner. Each returns the position one past the scanned token, or npos.
std::size_t scan_value(const std::string &text, std::size_t pos, std::size_t depth);

std::size_t scan_string(const std::string &text, std::size_t pos) {
  if (pos >= text.size() || text[pos] != '"') {
    return std::string::npos;
  }
  ++pos;
  while (pos < text.size()) {
    const auto ch = static_cast<unsigned char>(text[pos]);
    if (ch == '"') {
      return pos + 1;
    }
    if (ch < 0x20) {
      return std::string::npos;
    }
    if (ch == '\\') {
      if (pos + 1 >= text.size()) {
        return std::string::npos;
      }
      const char esc = text[pos + 1];
      if (esc == 'u') {
        std::uint32_t ignored = 0;
        if (!parse_hex4(text, pos + 2, ignored)) {
          return std::string::npos;
        }
        pos += 6;
        continue;
      }
      if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
          esc != 'r' && esc != 't') {
        return std::string::npos;
      }
      pos += 2;
      continue;
    }
    ++pos;
  }
  return std::string::npos;
}

std::size_t scan_digits(const std::string &text, std::size_t pos) {
  const std::size_t start = pos;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos == start ? std::string::npos : pos;
}

std::size_t scan_number(const std::string &text, std::size_t pos) {
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  pos = scan_digits(text, pos);
  if (pos == std::string::npos) {
    return pos;
  }
  if (pos < text.size() && text[pos] == '.') {
    pos = scan_digits(text, pos + 1);
    if (pos == std::string::npos) {
      return pos;
    }
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    pos = scan_digits(text, pos);
  }
  return pos;
}

std::size_t scan_literal(const std::string &text, const std::size_t pos, const char *literal) {
  const std::string word(literal);
  if (text.compare(pos, word.size(), word) != 0) {
    return std::string::npos;
  }
  return pos + word.size();
}

std::size_t scan_container(const std::string &text, std::size_t pos, const std::size_t depth,
                           const bool object) {
  const char close = object ? '}' : ']';
  ++pos;
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == close) {
    return pos + 1;
  }
  while (pos < text.size()) {
    if (object) {
      pos = scan_string(text, pos);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text, pos);
      if (pos >= text.size() || text[pos] != ':') {
        return std::string::npos;
      }
      pos = json_skip_ws(text, pos + 1);
    }
    pos = scan_value(text, pos, depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ',') {
      pos = json_skip_ws(text, pos + 1);
      continue;
    }
    if (pos < text.size() && text[pos] == close) {
      return pos + 1;
    }
    return std::string::npos;
  }
  return std::string::npos;
}

std::size_t scan_value(const std::string &text, const std::size_t pos, const std::size_t depth) {
  if (depth > kMaxDepth || pos >= text.size()) {
    return std::string::npos;
  }
  switch (text[pos]) {
  case '"':
    return scan_string(text, pos);
  case '{':
    return scan_container(text, pos, depth, true);
  case '[':
    return scan_container(text, pos, depth, false);
  case 't':
    return scan_literal(text, pos, "true");
  case 'f':
    return scan_literal(text, pos, "false");
  case 'n':
    return scan_literal(text, pos, "null");
  default:
    return scan_number(text, pos);
  }
}

std::string offset_message(const std::string &what, const std::size_t pos) {
  return what + " at offset " + std::to_string(pos);
}

constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when the
// bytes there are not well-formed UTF-8.
std::size_t utf8_sequence_length(const std::string &text, const std::size_t pos) {
  const auto byte = [&](const std::size_t offset) {
    return static_cast<unsigned char>(text[pos + offset]);
  };
  const unsigned char lead = byte(0);
  std::size_t length = 0;
  unsigned char min_second = 0x80;
  unsigned char max_second = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      min_second = 0xA0;
    } else if (lead == 0xED) {
      max_second = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      min_second = 0x90;
    } else if (lead == 0xF4) {
      max_second = 0x8F;
    }
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  if (byte(1) < min_second || byte(1) > max_second) {
    return 0;
  }
  for (std::size_t k = 2; k < length; ++k) {
    if ((byte(k) & 0xC0U) != 0x80U) {
      return 0;
    }
  }
  return length;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else if (static_cast<unsigned char>(ch) < 0x80) {
        escaped.push_back(ch);
      } else if (const std::size_t length = utf8_sequence_length(value, i); length > 0) {
        escaped.append(value, i, length);
        i += length - 1;
      } else {
        // Invalid UTF-8 byte.
        escaped += kReplacementCharacter;
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t code = 0;
      if (!parse_hex4(raw, i + 1, code)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

Result<JsonFields> json_parse_object(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonFields>::failure(ErrorKind::Parse, "expected JSON object");
  }

  JsonFields fields;
  pos = json_skip_ws(json, pos + 1);
  if (pos < json.size() && json[pos] == '}') {
    ++pos;
  } else {
    while (true) {
      const std::size_t key_end = scan_string(json, pos);
      if (key_end == std::string::npos) {
        return Result<JsonFields>::failure(ErrorKind::Parse,
                                           offset_message("expected object key", pos));
      }
      std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 2));
      pos = json_skip_ws(json, key_end);
      if (pos >= json.size() || json[pos] != ':') {
        return Result<JsonFields>::failure(ErrorKind::Parse, offset_message("expected ':'", pos));
      }
      pos = json_skip_ws(json, pos + 1);
      const std::size_t value_end = scan_value(json, pos, 1);
      if (value_end == std::string::npos) {
        return Result<JsonFields>::failure(ErrorKind::Parse,
                                           offset_message("invalid value for key '" + key + "'",
                                                          pos));
      }
      fields[std::move(key)] = json.substr(pos, value_end - pos);
      pos = json_skip_ws(json, value_end);
      if (pos < json.size() && json[pos] == ',') {
        pos = json_skip_ws(json, pos + 1);
        continue;
      }
      if (pos < json.size() && json[pos] == '}') {
        ++pos;
        break;
      }
      return Result<JsonFields>::failure(ErrorKind::Parse,
                                         offset_message("expected ',' or '}'", pos));
    }
  }

  if (json_skip_ws(json, pos) != json.size()) {
    return Result<JsonFields>::failure(ErrorKind::Parse,
                                       offset_message("trailing characters", pos));
  }
  return Result<JsonFields>::success(std::move(fields));
}

Result<std::vector<std::string>> json_parse_array(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return Result<std::vector<std::string>>::failure(ErrorKind::Parse, "expected JSON array");
  }

  std::vector<std::string> items;
  pos = json_skip_ws(json, pos + 1);
  if (pos < json.size() && json[pos] == ']') {
    ++pos;
  } else {
    while (true) {
      const std::size_t value_end = scan_value(json, pos, 1);
      if (value_end == std::string::npos) {
        return Result<std::vector<std::string>>::failure(
            ErrorKind::Parse, offset_message("invalid array element", pos));
      }
      items.push_back(json.substr(pos, value_end - pos));
      pos = json_skip_ws(json, value_end);
      if (pos < json.size() && json[pos] == ',') {
        pos = json_skip_ws(json, pos + 1);
        continue;
      }
      if (pos < json.size() && json[pos] == ']') {
        ++pos;
        break;
      }
      return Result<std::vector<std::string>>::failure(
          ErrorKind::Parse, offset_message("expected ',' or ']'", pos));
    }
  }

  if (json_skip_ws(json, pos) != json.size()) {
    return Result<std::vector<std::string>>::failure(
        ErrorKind::Parse, offset_message("trailing characters", pos));
  }
  return Result<std::vector<std::string>>::success(std::move(items));
}

Result<std::string> json_decode_string(const std::string &raw) {
  const std::size_t begin = json_skip_ws(raw, 0);
  const std::size_t end = scan_string(raw, begin);
  if (end == std::string::npos || json_skip_ws(raw, end) != raw.size()) {
    return Result<std::string>::failure(ErrorKind::Parse, "expected JSON string");
  }
  return Result<std::string>::success(json_unescape(raw.substr(begin + 1, end - begin - 2)));
}

bool json_is_string(const std::string &raw) {
  const std::size_t pos = json_skip_ws(raw, 0);
  return pos < raw.size() && raw[pos] == '"';
}

bool json_is_null(const std::string &raw) {
  const std::size_t pos = json_skip_ws(raw, 0);
  return raw.compare(pos, 4, "null") == 0 && json_skip_ws(raw, pos + 4) == raw.size();
}

std::string json_field_string(const JsonFields &fields, const std::string &key,
                              const std::string &fallback) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return fallback;
  }
  auto decoded = json_decode_string(it->second);
  return decoded.ok() ? decoded.value() : fallback;
}

} // namespace tai::common
