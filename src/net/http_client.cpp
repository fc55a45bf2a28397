#include "net/http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <utility>

namespace netmon_agent::net {
namespace {

struct CurlDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    if (list != nullptr) {
      curl_slist_free_all(list);
    }
  }
};

std::size_t append_body(char* data, std::size_t size, std::size_t count, void* user) {
  auto* body = static_cast<std::string*>(user);
  body->append(data, size * count);
  return size * count;
}

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) { ensure_curl_global_init(); }

  HttpResponse send(const HttpRequest& request) override {
    HttpResponse response{};

    std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
    if (handle == nullptr) {
      response.transport_error = "curl_easy_init failed";
      return response;
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const auto& [name, value] : request.headers) {
      const std::string line = name + ": " + value;
      curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
      if (appended == nullptr) {
        response.transport_error = "curl_slist_append failed";
        return response;
      }
      headers.release();
      headers.reset(appended);
    }

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    if (request.follow_redirects) {
      curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
      curl_easy_setopt(curl, CURLOPT_MAXREDIRS, request.max_redirects);
    }
    if (!request.verify_tls) {
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (request.method == HttpMethod::post) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    const CURLcode code = curl_easy_perform(curl);
    double total_seconds = 0.0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_seconds);
    response.elapsed_ms = total_seconds * 1000.0;

    if (code != CURLE_OK) {
      response.transport_error = curl_easy_strerror(code);
      return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
  }

 private:
  std::string user_agent_;
};

}  // namespace

std::unique_ptr<HttpClient> make_curl_http_client(std::string user_agent) {
  return std::make_unique<CurlHttpClient>(std::move(user_agent));
}

}  // namespace netmon_agent::net
