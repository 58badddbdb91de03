#include "tai/providers/traits.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tai::providers {

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after << "s";
  }
  if (!message.empty()) {
    stream << ": " << message;
  }
  return stream.str();
}

std::string_view role_name(const Role role) {
  switch (role) {
  case Role::System:
    return "system";
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  }
  return "user";
}

common::Result<ChatResponse> provider_failure(const ProviderError &error) {
  return common::Result<ChatResponse>::failure(common::ErrorKind::Provider, error.to_string());
}

std::optional<ProviderError> classify_response(const common::HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status == 401 || response.status == 403) {
    return ProviderError{
        .code = ProviderErrorCode::AuthError, .status = response.status, .message = response.body};
  }
  if (response.status == 404) {
    return ProviderError{.code = ProviderErrorCode::ModelNotFound,
                         .status = response.status,
                         .message = response.body};
  }
  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    const auto it = response.headers.find("retry-after");
    if (it != response.headers.end()) {
      const std::string value = common::trim(it->second);
      if (!value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
          }) && value.size() < 19) {
        error.retry_after = std::stoull(value);
      }
    }
    return error;
  }
  if (response.status < 200 || response.status >= 300) {
    return ProviderError{
        .code = ProviderErrorCode::ApiError, .status = response.status, .message = response.body};
  }
  return std::nullopt;
}

std::string normalize_arguments(const std::string &raw) {
  const std::string trimmed = common::trim(raw);
  if (trimmed.empty() || !common::json_parse_object(trimmed).ok()) {
    return "{}";
  }
  return trimmed;
}

} // namespace tai::providers
