#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace pairgate::common {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpClientResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers; // lower-cased keys
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// `method` is sent verbatim; a body is attached whenever one is given.
  [[nodiscard]] virtual HttpClientResponse request(const std::string &method,
                                                   const std::string &url,
                                                   const HeaderMap &headers,
                                                   const std::optional<std::string> &body,
                                                   std::uint64_t timeout_ms) = 0;

  [[nodiscard]] HttpClientResponse get(const std::string &url, const HeaderMap &headers,
                                       std::uint64_t timeout_ms) {
    return request("GET", url, headers, std::nullopt, timeout_ms);
  }
  [[nodiscard]] HttpClientResponse post_json(const std::string &url, const HeaderMap &headers,
                                             const std::string &body, std::uint64_t timeout_ms) {
    return request("POST", url, headers, body, timeout_ms);
  }
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpClientResponse request(const std::string &method, const std::string &url,
                                           const HeaderMap &headers,
                                           const std::optional<std::string> &body,
                                           std::uint64_t timeout_ms) override;
};

} // namespace pairgate::common
