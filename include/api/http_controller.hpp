#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "api/controller.hpp"

namespace netmon_agent::net {
class HttpClient;
}

namespace netmon_agent::api {

inline constexpr const char* kApiPrefix = "/api/agent";

struct ControllerOptions {
  std::string base_url{};
  std::string api_key{};
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

// REST client for the controller over an HttpClient. The client must outlive
// the returned object.
std::unique_ptr<ControllerApi> make_http_controller(ControllerOptions options, net::HttpClient& http);

}  // namespace netmon_agent::api
