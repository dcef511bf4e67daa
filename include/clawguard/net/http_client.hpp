#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace clawguard::net {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Header names are lowercased.
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  /// The connection was refused because the peer address is not public.
  bool blocked_address = false;
  std::string network_error_message;

  [[nodiscard]] bool is_redirect() const { return status >= 300 && status < 400; }
  [[nodiscard]] bool is_success() const { return status >= 200 && status < 300; }
};

struct GetOptions {
  std::uint64_t timeout_ms = 10000;
  /// Refuse to connect to private/reserved peers, checked on the address actually dialled.
  bool public_only = false;
  std::size_t max_body_bytes = 2 * 1024 * 1024;
};

/// Redirects are never followed; callers validate each hop themselves.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         const GetOptions &options) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 const GetOptions &options) override;
};

} // namespace clawguard::net
