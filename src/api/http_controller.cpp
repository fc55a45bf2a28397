#include "api/http_controller.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/json_codec.hpp"
#include "core/log.hpp"
#include "core/timestamp.hpp"
#include "core/version.hpp"
#include "net/http_client.hpp"

namespace netmon_agent::api {
namespace {

using nlohmann::json;

const char* method_name(const net::HttpMethod method) {
  return method == net::HttpMethod::get ? "GET" : "POST";
}

class HttpController final : public ControllerApi {
 public:
  HttpController(ControllerOptions options, net::HttpClient& http) : options_(std::move(options)), http_(http) {}

  HeartbeatResponse heartbeat(const HeartbeatRequest& request) override {
    core::log_debug("api", "sending heartbeat");
    const json body = call(net::HttpMethod::post, "/heartbeat", json(request));
    return decode<HeartbeatResponse>("/heartbeat", body);
  }

  DiscoveryUploadResult upload_discovered_devices(const std::string& segment_id,
                                                  const std::vector<model::DiscoveredDevice>& devices) override {
    core::log_debug("api", "uploading " + std::to_string(devices.size()) + " discovered devices for segment " + segment_id);
    const json request = {
        {"segment_id", segment_id},
        {"scan_timestamp", core::iso8601_now()},
        {"devices", devices},
    };
    return decode<DiscoveryUploadResult>("/devices/discovered", call(net::HttpMethod::post, "/devices/discovered", request));
  }

  std::vector<model::DeviceToMonitor> devices_to_monitor() override {
    const json body = call(net::HttpMethod::get, "/devices", std::nullopt);
    if (!body.contains("devices")) {
      throw ControllerError("GET /devices: response has no devices array");
    }
    return decode<std::vector<model::DeviceToMonitor>>("/devices", body.at("devices"));
  }

  StatusUploadResult upload_status_reports(const std::vector<model::StatusReport>& reports) override {
    core::log_debug("api", "uploading " + std::to_string(reports.size()) + " status reports");
    const json request = {{"reports", reports}};
    return decode<StatusUploadResult>("/devices/status", call(net::HttpMethod::post, "/devices/status", request));
  }

  model::NetworkSegment register_auto_segment(const AutoSegmentRequest& request) override {
    core::log_info("api", "registering auto-detected segment " + request.name);
    const json body = call(net::HttpMethod::post, "/segments/register", json(request));
    if (!body.contains("segment")) {
      throw ControllerError("POST /segments/register: response has no segment");
    }
    return decode<model::NetworkSegment>("/segments/register", body.at("segment"));
  }

  void acknowledge_command(const std::string& command_id, const model::CommandAck& ack) override {
    core::log_debug("api", "acknowledging command " + command_id + (ack.success ? ": completed" : ": failed"));
    (void)call(net::HttpMethod::post, "/commands/" + command_id + "/ack", json(ack));
  }

  PongResult send_pong(const std::optional<std::string>& command_id) override {
    json request = {{"agent_timestamp", core::iso8601_now()}};
    if (command_id.has_value()) {
      request["command_id"] = *command_id;
    }
    const json body = call(net::HttpMethod::post, "/ping", request);
    PongResult result{};
    const auto latency = body.find("latency_ms");
    if (latency != body.end() && latency->is_number()) {
      result.latency_ms = latency->get<double>();
    }
    return result;
  }

 private:
  json call(const net::HttpMethod method, const std::string& path, const std::optional<json>& body) {
    const std::string label = std::string(method_name(method)) + " " + path;

    net::HttpRequest request{};
    request.method = method;
    request.url = options_.base_url + kApiPrefix + path;
    request.timeout = options_.timeout;
    request.headers["Authorization"] = "Bearer " + options_.api_key;
    request.headers["Content-Type"] = "application/json";
    request.headers["X-Agent-Client"] = std::string("netmon-agent/") + core::kAgentVersion;
    if (body.has_value()) {
      // Device strings come from mDNS, SSDP and SNMP and may carry Latin-1 bytes.
      try {
        request.body = body->dump(-1, ' ', false, json::error_handler_t::replace);
      } catch (const json::exception& e) {
        throw ControllerError(label + ": cannot encode request: " + e.what());
      }
    }

    const net::HttpResponse response = http_.send(request);
    if (response.transport_error.has_value()) {
      throw ControllerError(label + ": " + *response.transport_error);
    }
    if (!response.ok()) {
      throw ControllerError(label + ": HTTP " + std::to_string(response.status_code), response.status_code);
    }
    if (response.body.empty()) {
      return json::object();
    }

    json parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      throw ControllerError(label + ": response is not a JSON object", response.status_code);
    }
    return parsed;
  }

  template <typename T>
  static T decode(const std::string& path, const json& body) {
    try {
      return body.get<T>();
    } catch (const json::exception& e) {
      throw ControllerError(path + ": unexpected response shape: " + e.what());
    }
  }

  ControllerOptions options_;
  net::HttpClient& http_;
};

}  // namespace

std::unique_ptr<ControllerApi> make_http_controller(ControllerOptions options, net::HttpClient& http) {
  return std::make_unique<HttpController>(std::move(options), http);
}

}  // namespace netmon_agent::api
