#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tai::common {

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::uint64_t timeout_ms = 60000;
  std::uint64_t connect_timeout_ms = 0;
  /// Stop the transfer once this many body bytes arrived. Zero means unlimited.
  std::size_t max_body_bytes = 0;
  bool follow_redirects = true;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Header names are lower-cased. Only the final response's headers are kept.
  std::unordered_map<std::string, std::string> headers;
  std::string final_url;
  bool truncated = false;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
};

} // namespace tai::common
