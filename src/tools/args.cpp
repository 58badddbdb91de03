#include "tai/tools/args.hpp"

#include "tai/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace tai::tools {

namespace {

const std::string *find_arg(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end() || common::json_is_null(it->second)) {
    return nullptr;
  }
  return &it->second;
}

common::Status type_error(const std::string &key, const std::string &expected) {
  return common::Status::error(common::ErrorKind::Validation,
                               "Invalid argument '" + key + "': expected " + expected);
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  if (text.empty() || !std::all_of(text.begin(), text.end(), [](const unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

bool has_arg(const ToolArgs &args, const std::string &key) {
  return find_arg(args, key) != nullptr;
}

common::Result<std::string> required_string(const ToolArgs &args, const std::string &key) {
  const std::string *raw = find_arg(args, key);
  if (raw == nullptr) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Missing required argument: " + key);
  }
  return string_or(args, key, "");
}

common::Result<std::string> string_or(const ToolArgs &args, const std::string &key,
                                      const std::string &fallback) {
  const std::string *raw = find_arg(args, key);
  if (raw == nullptr) {
    return common::Result<std::string>::success(fallback);
  }
  if (!common::json_is_string(*raw)) {
    const auto status = type_error(key, "string");
    return common::Result<std::string>::failure(status.kind(), status.error());
  }
  auto decoded = common::json_decode_string(*raw);
  if (!decoded.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Parse,
                                                "Invalid argument '" + key + "': " +
                                                    decoded.error());
  }
  return decoded;
}

common::Result<std::uint64_t> u64_or(const ToolArgs &args, const std::string &key,
                                     const std::uint64_t fallback) {
  const std::string *raw = find_arg(args, key);
  if (raw == nullptr) {
    return common::Result<std::uint64_t>::success(fallback);
  }
  std::string text = common::trim(*raw);
  if (common::json_is_string(text)) {
    auto decoded = common::json_decode_string(text);
    text = decoded.ok() ? common::trim(decoded.value()) : "";
  }
  if (const auto value = parse_u64(text); value.has_value()) {
    return common::Result<std::uint64_t>::success(*value);
  }
  const auto status = type_error(key, "non-negative integer");
  return common::Result<std::uint64_t>::failure(status.kind(), status.error());
}

common::Result<std::uint64_t> u64_in_range(const ToolArgs &args, const std::string &key,
                                           const std::uint64_t fallback, const std::uint64_t min,
                                           const std::uint64_t max) {
  auto value = u64_or(args, key, fallback);
  if (!value.ok()) {
    return value;
  }
  if (value.value() < min || value.value() > max) {
    return common::Result<std::uint64_t>::failure(
        common::ErrorKind::Validation, "Invalid argument '" + key + "': expected an integer from " +
                                           std::to_string(min) + " to " + std::to_string(max));
  }
  return value;
}

common::Result<bool> bool_or(const ToolArgs &args, const std::string &key, const bool fallback) {
  const std::string *raw = find_arg(args, key);
  if (raw == nullptr) {
    return common::Result<bool>::success(fallback);
  }
  std::string text = common::trim(*raw);
  if (common::json_is_string(text)) {
    auto decoded = common::json_decode_string(text);
    text = decoded.ok() ? common::to_lower(common::trim(decoded.value())) : "";
  }
  if (text == "true") {
    return common::Result<bool>::success(true);
  }
  if (text == "false") {
    return common::Result<bool>::success(false);
  }
  const auto status = type_error(key, "boolean");
  return common::Result<bool>::failure(status.kind(), status.error());
}

common::Result<std::vector<std::string>> string_list(const ToolArgs &args,
                                                     const std::string &key) {
  using ResultT = common::Result<std::vector<std::string>>;
  const std::string *raw = find_arg(args, key);
  if (raw == nullptr) {
    return ResultT::success({});
  }
  if (common::json_is_string(*raw)) {
    auto single = string_or(args, key, "");
    if (!single.ok()) {
      return ResultT::failure(single.kind(), single.error());
    }
    return ResultT::success({single.value()});
  }

  auto elements = common::json_parse_array(*raw);
  if (!elements.ok()) {
    const auto status = type_error(key, "array of strings");
    return ResultT::failure(status.kind(), status.error());
  }
  std::vector<std::string> out;
  out.reserve(elements.value().size());
  for (const auto &element : elements.value()) {
    if (!common::json_is_string(element)) {
      const auto status = type_error(key, "array of strings");
      return ResultT::failure(status.kind(), status.error());
    }
    auto decoded = common::json_decode_string(element);
    if (!decoded.ok()) {
      return ResultT::failure(common::ErrorKind::Parse, decoded.error());
    }
    out.push_back(decoded.value());
  }
  return ResultT::success(std::move(out));
}

common::Result<std::vector<std::pair<std::string, std::string>>>
string_map(const ToolArgs &args, const std::string &key) {
  using ResultT = common::Result<std::vector<std::pair<std::string, std::string>>>;
  const std::string *raw = find_arg(args, key);
  if (raw == nullptr) {
    return ResultT::success({});
  }
  auto fields = common::json_parse_object(*raw);
  if (!fields.ok()) {
    const auto status = type_error(key, "object of strings");
    return ResultT::failure(status.kind(), status.error());
  }

  std::vector<std::pair<std::string, std::string>> out;
  for (const auto &[name, value] : fields.value()) {
    if (!common::json_is_string(value)) {
      const auto status = type_error(key + "." + name, "string");
      return ResultT::failure(status.kind(), status.error());
    }
    auto decoded = common::json_decode_string(value);
    if (!decoded.ok()) {
      return ResultT::failure(common::ErrorKind::Parse, decoded.error());
    }
    out.emplace_back(name, decoded.value());
  }
  std::sort(out.begin(), out.end());
  return ResultT::success(std::move(out));
}

} // namespace tai::tools
