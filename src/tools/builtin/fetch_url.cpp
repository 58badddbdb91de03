#include "tai/tools/builtin/fetch_url.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"
#include "tai/tools/args.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <sstream>

namespace tai::tools {

namespace {

constexpr std::uint64_t kMaxTimeoutSec = 60 * 60;
constexpr std::uint64_t kMaxBodyBytes = 64ULL * 1024 * 1024;

constexpr std::array<std::string_view, 6> kMethods = {"GET", "POST", "PUT",
                                                      "PATCH", "DELETE", "HEAD"};

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

// Drops an incomplete multi-byte UTF-8 sequence left at the end of a cut body.
void trim_partial_utf8(std::string &text) {
  std::size_t i = text.size();
  std::size_t continuation = 0;
  while (i > 0 && continuation < 3 &&
         (static_cast<unsigned char>(text[i - 1]) & 0xC0U) == 0x80U) {
    --i;
    ++continuation;
  }
  if (i == 0) {
    return;
  }
  const auto lead = static_cast<unsigned char>(text[i - 1]);
  std::size_t expected = 1;
  if ((lead & 0xE0U) == 0xC0U) {
    expected = 2;
  } else if ((lead & 0xF0U) == 0xE0U) {
    expected = 3;
  } else if ((lead & 0xF8U) == 0xF0U) {
    expected = 4;
  } else {
    return;
  }
  if (continuation + 1 < expected) {
    text.resize(i - 1);
  }
}

} // namespace

FetchUrlTool::FetchUrlTool(std::shared_ptr<common::HttpClient> http,
                           const std::uint64_t default_timeout_sec,
                           const std::uint64_t default_max_bytes)
    : http_(std::move(http)), default_timeout_sec_(default_timeout_sec),
      default_max_bytes_(default_max_bytes) {}

std::string_view FetchUrlTool::name() const { return "fetch_url"; }

std::string_view FetchUrlTool::description() const {
  return "Fetch a URL over HTTP(S). Returns status, headers, and text body (truncated).";
}

std::vector<ToolParameter> FetchUrlTool::parameters() const {
  return {
      {.name = "url", .type = "string", .description = "The URL to fetch", .required = true},
      {.name = "method",
       .type = "string",
       .description = "HTTP method (GET, POST, PUT, PATCH, DELETE, HEAD). Default GET"},
      {.name = "headers", .type = "object", .description = "Optional request headers"},
      {.name = "body", .type = "string", .description = "Optional request body"},
      {.name = "timeout_sec",
       .type = "integer",
       .description = "Request timeout in seconds (default 10)"},
      {.name = "max_bytes",
       .type = "integer",
       .description = "Maximum response bytes to return (default 200000)"},
  };
}

common::Result<std::string> FetchUrlTool::execute(const ToolArgs &args) {
  auto url = required_string(args, "url");
  if (!url.ok()) {
    return url;
  }
  const auto scheme_end = url.value().find("://");
  const std::string scheme =
      scheme_end == std::string::npos ? "" : common::to_lower(url.value().substr(0, scheme_end));
  if (scheme != "http" && scheme != "https") {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Only http/https URLs are allowed");
  }
  auto method = string_or(args, "method", "GET");
  if (!method.ok()) {
    return method;
  }
  const std::string verb = to_upper(method.value());
  if (std::find(kMethods.begin(), kMethods.end(), verb) == kMethods.end()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Unsupported method: " + method.value());
  }
  auto timeout_sec = u64_in_range(args, "timeout_sec", default_timeout_sec_, 1, kMaxTimeoutSec);
  if (!timeout_sec.ok()) {
    return common::Result<std::string>::failure(timeout_sec.kind(), timeout_sec.error());
  }
  auto max_bytes = u64_in_range(args, "max_bytes", default_max_bytes_, 1, kMaxBodyBytes);
  if (!max_bytes.ok()) {
    return common::Result<std::string>::failure(max_bytes.kind(), max_bytes.error());
  }
  auto headers = string_map(args, "headers");
  if (!headers.ok()) {
    return common::Result<std::string>::failure(headers.kind(), headers.error());
  }
  auto body = string_or(args, "body", "");
  if (!body.ok()) {
    return body;
  }

  const std::uint64_t timeout_ms = timeout_sec.value() * 1000;
  common::HttpRequest request{.method = verb,
                              .url = url.value(),
                              .headers = headers.value(),
                              .body = body.value(),
                              .timeout_ms = timeout_ms,
                              .connect_timeout_ms = timeout_ms,
                              .max_body_bytes = static_cast<std::size_t>(max_bytes.value()),
                              .follow_redirects = true};
  auto response = http_->send(request);
  if (response.timeout) {
    return common::Result<std::string>::failure(
        common::ErrorKind::Timeout, "Request timed out after " +
                                        std::to_string(timeout_sec.value()) + "s for " +
                                        url.value());
  }
  if (response.network_error) {
    return common::Result<std::string>::failure(common::ErrorKind::Network,
                                                "Request failed for " + url.value() + ": " +
                                                    response.network_error_message);
  }

  std::string text = std::move(response.body);
  // Bodies can also overshoot the cap when the client does not enforce it.
  if (text.size() > max_bytes.value()) {
    text.resize(static_cast<std::size_t>(max_bytes.value()));
    response.truncated = true;
  }
  if (response.truncated) {
    trim_partial_utf8(text);
  }

  const std::map<std::string, std::string> sorted_headers(response.headers.begin(),
                                                          response.headers.end());
  std::ostringstream out;
  out << "{\"url\":" << common::json_quote(url.value())
      << ",\"final_url\":" << common::json_quote(response.final_url.empty() ? url.value()
                                                                             : response.final_url)
      << ",\"status\":" << response.status << ",\"headers\":{";
  bool first = true;
  for (const auto &[key, value] : sorted_headers) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(key) << ":" << common::json_quote(value);
  }
  out << "},\"truncated\":" << (response.truncated ? "true" : "false")
      << ",\"text\":" << common::json_quote(text) << "}";
  return common::Result<std::string>::success(out.str());
}

std::string_view FetchUrlTool::group() const { return "network"; }

} // namespace tai::tools
