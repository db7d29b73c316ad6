#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace switchboard::net {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

struct PostOptions {
  std::uint64_t timeout_ms = 15'000;
  /// Skip peer and host verification for https endpoints.
  bool tls_insecure = false;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// POSTs the fields as application/x-www-form-urlencoded.
  [[nodiscard]] virtual HttpResponse post_form(const std::string &url, const FormFields &fields,
                                               const PostOptions &options) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_form(const std::string &url, const FormFields &fields,
                                       const PostOptions &options) override;
};

} // namespace switchboard::net
