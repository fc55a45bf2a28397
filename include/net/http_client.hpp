#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace netmon_agent::net {

enum class HttpMethod {
  get,
  post,
};

struct HttpRequest {
  HttpMethod method{HttpMethod::get};
  std::string url{};
  std::map<std::string, std::string> headers{};
  std::string body{};
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  bool follow_redirects{false};
  long max_redirects{5};
  bool verify_tls{true};
};

struct HttpResponse {
  long status_code{0};
  std::string body{};
  double elapsed_ms{0.0};
  // Set when no HTTP response was received at all.
  std::optional<std::string> transport_error{};

  [[nodiscard]] bool ok() const noexcept { return !transport_error.has_value() && status_code >= 200 && status_code < 300; }
};

// Blocking HTTP capability. Transport failures are reported in the response.
class HttpClient {
 public:
  virtual HttpResponse send(const HttpRequest& request) = 0;
  virtual ~HttpClient() = default;
};

// libcurl easy interface, one handle per request.
std::unique_ptr<HttpClient> make_curl_http_client(std::string user_agent);

}  // namespace netmon_agent::net
