#include "api/realtime_channel.hpp"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "api/json_codec.hpp"
#include "api/realtime_subscriber.hpp"
#include "core/log.hpp"

namespace netmon_agent::api {
namespace {

using nlohmann::json;

std::string string_field(const json& object, const char* key) {
  const auto it = object.find(key);
  return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

bool is_pending(const json& record) { return string_field(record, "status") == "pending"; }

std::optional<model::AgentCommand> command_from_change(const json& change) {
  const auto record = change.find("record");
  if (record == change.end() || !record->is_object() || !is_pending(*record)) {
    return std::nullopt;
  }

  const std::string kind = string_field(change, "type");
  if (kind == "UPDATE") {
    const auto old_record = change.find("old_record");
    if (old_record != change.end() && old_record->is_object() && is_pending(*old_record)) {
      return std::nullopt;
    }
  } else if (kind != "INSERT") {
    return std::nullopt;
  }

  try {
    return record->get<model::AgentCommand>();
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

bool valid_port(const std::string& text) {
  if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  const int port = std::stoi(text);
  return port > 0 && port <= 65535;
}

std::string url_encode(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  for (const unsigned char c : value) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                            c == '.' || c == '_' || c == '~';
    if (unreserved) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

json change_filter(const char* event, const std::string& agent_id) {
  return json{
      {"event", event},
      {"schema", "public"},
      {"table", "agent_commands"},
      {"filter", "agent_id=eq." + agent_id},
  };
}

}  // namespace

bool operator==(const RealtimeCredentials& lhs, const RealtimeCredentials& rhs) {
  return lhs.url == rhs.url && lhs.key == rhs.key;
}

bool operator!=(const RealtimeCredentials& lhs, const RealtimeCredentials& rhs) { return !(lhs == rhs); }

RealtimeTransport realtime_transport(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return RealtimeTransport::unsupported;
  }
  const std::string scheme = url.substr(0, scheme_end);
  if (scheme == "https" || scheme == "http" || scheme == "wss" || scheme == "ws") {
    return RealtimeTransport::supabase;
  }
  if (scheme == "redis") {
    return RealtimeTransport::redis;
  }
  return RealtimeTransport::unsupported;
}

std::optional<SocketEndpoint> supabase_socket_endpoint(const std::string& url, const std::string& key) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || realtime_transport(url) != RealtimeTransport::supabase) {
    return std::nullopt;
  }

  SocketEndpoint endpoint{};
  const std::string scheme = url.substr(0, scheme_end);
  endpoint.tls = scheme == "https" || scheme == "wss";
  endpoint.port = endpoint.tls ? "443" : "80";

  std::string rest = url.substr(scheme_end + 3);
  std::string base_path;
  const auto path_pos = rest.find('/');
  if (path_pos != std::string::npos) {
    base_path = rest.substr(path_pos);
    rest.erase(path_pos);
  }
  while (!base_path.empty() && base_path.back() == '/') {
    base_path.pop_back();
  }

  const auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    const std::string port = rest.substr(colon + 1);
    if (!valid_port(port)) {
      return std::nullopt;
    }
    endpoint.port = port;
    rest.erase(colon);
  }
  if (rest.empty() || rest.find('@') != std::string::npos) {
    return std::nullopt;
  }

  endpoint.host = rest;
  endpoint.target = base_path + "/realtime/v1/websocket?apikey=" + url_encode(key) + "&vsn=1.0.0";
  return endpoint;
}

std::optional<RedisEndpoint> parse_redis_url(const std::string& url) {
  constexpr const char* kScheme = "redis://";
  if (url.rfind(kScheme, 0) != 0) {
    return std::nullopt;
  }
  std::string rest = url.substr(std::string(kScheme).size());

  const auto path_pos = rest.find('/');
  if (path_pos != std::string::npos) {
    rest.erase(path_pos);
  }

  RedisEndpoint endpoint{};
  const auto at_pos = rest.rfind('@');
  if (at_pos != std::string::npos) {
    const std::string userinfo = rest.substr(0, at_pos);
    const auto colon = userinfo.find(':');
    endpoint.password = colon == std::string::npos ? userinfo : userinfo.substr(colon + 1);
    rest.erase(0, at_pos + 1);
  }

  const auto colon_pos = rest.rfind(':');
  if (colon_pos != std::string::npos) {
    const std::string port_text = rest.substr(colon_pos + 1);
    if (!valid_port(port_text)) {
      return std::nullopt;
    }
    endpoint.port = static_cast<std::uint16_t>(std::stoi(port_text));
    rest.erase(colon_pos);
  }

  if (rest.empty()) {
    return std::nullopt;
  }
  endpoint.host = rest;
  return endpoint;
}

std::string command_channel_name(const std::string& agent_id) { return "agent_commands:" + agent_id; }

std::string command_topic(const std::string& agent_id) { return "realtime:agent-commands-" + agent_id; }

std::string phoenix_join_message(const std::string& agent_id, const std::string& access_token, const std::string& ref) {
  const json config = {
      {"broadcast", {{"ack", false}, {"self", false}}},
      {"presence", {{"key", ""}}},
      {"postgres_changes", json::array({change_filter("INSERT", agent_id), change_filter("UPDATE", agent_id)})},
      {"private", false},
  };
  const json message = {
      {"topic", command_topic(agent_id)},
      {"event", "phx_join"},
      {"payload", {{"config", config}, {"access_token", access_token}}},
      {"ref", ref},
      {"join_ref", ref},
  };
  return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string phoenix_heartbeat_message(const std::string& ref) {
  const json message = {
      {"topic", "phoenix"},
      {"event", "heartbeat"},
      {"payload", json::object()},
      {"ref", ref},
  };
  return message.dump();
}

std::optional<model::AgentCommand> parse_realtime_message(const std::string& payload) {
  const json message = json::parse(payload, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return std::nullopt;
  }
  return command_from_change(message);
}

PhoenixEvent parse_phoenix_frame(const std::string& frame, const std::string& topic, const std::string& join_ref) {
  PhoenixEvent event{};
  const json message = json::parse(frame, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return event;
  }

  const std::string name = string_field(message, "event");
  const std::string frame_topic = string_field(message, "topic");
  const auto payload_it = message.find("payload");
  const json payload = payload_it != message.end() && payload_it->is_object() ? *payload_it : json::object();

  if (frame_topic == "phoenix" && name == "phx_reply") {
    event.kind = PhoenixEvent::Kind::heartbeat_reply;
    event.detail = string_field(message, "ref");
    return event;
  }
  if (frame_topic != topic) {
    return event;
  }

  if (name == "phx_reply") {
    if (string_field(message, "ref") != join_ref) {
      return event;
    }
    if (string_field(payload, "status") == "ok") {
      event.kind = PhoenixEvent::Kind::joined;
    } else {
      event.kind = PhoenixEvent::Kind::join_failed;
      const auto response = payload.find("response");
      event.detail = response != payload.end() ? response->dump() : string_field(payload, "status");
    }
  } else if (name == "postgres_changes") {
    const auto data = payload.find("data");
    if (data != payload.end() && data->is_object()) {
      event.command = command_from_change(*data);
      if (event.command.has_value()) {
        event.kind = PhoenixEvent::Kind::command;
      }
    }
  } else if (name == "system") {
    if (string_field(payload, "status") == "error") {
      event.kind = PhoenixEvent::Kind::join_failed;
      event.detail = string_field(payload, "message");
    }
  } else if (name == "phx_error" || name == "phx_close") {
    event.kind = PhoenixEvent::Kind::closed;
    event.detail = name;
  }
  return event;
}

RealtimeSubscriber::RealtimeSubscriber(const RealtimeHandlers& handlers, const std::chrono::milliseconds reconnect_delay)
    : handlers_(handlers), reconnect_delay_(reconnect_delay) {}

RealtimeSubscriber::~RealtimeSubscriber() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void RealtimeSubscriber::start() { thread_ = std::thread([this] { run(); }); }

void RealtimeSubscriber::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    interrupt();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool RealtimeSubscriber::stopping() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopping_;
}

void RealtimeSubscriber::run() {
  while (!stopping()) {
    try {
      session();
    } catch (const std::exception& e) {
      core::log_warn("realtime", std::string("session failed: ") + e.what());
    }
    if (stopping()) {
      break;
    }
    core::log_debug("realtime", "reconnecting in " + std::to_string(reconnect_delay_.count()) + "ms");
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, reconnect_delay_, [this] { return stopping_; });
  }
}

void RealtimeSubscriber::deliver(model::AgentCommand command) {
  core::log_info("realtime", "command " + command.command_type + " (" + command.id + ")");
  if (handlers_.on_command) {
    handlers_.on_command(std::move(command));
  }
}

void RealtimeSubscriber::notify_connection(const bool connected) {
  if (handlers_.on_connection_change) {
    handlers_.on_connection_change(connected);
  }
}

RealtimeChannel::RealtimeChannel(RealtimeHandlers handlers, const std::chrono::milliseconds reconnect_delay)
    : handlers_(std::move(handlers)), reconnect_delay_(reconnect_delay) {}

RealtimeChannel::~RealtimeChannel() { stop(); }

void RealtimeChannel::update(const RealtimeCredentials& credentials, const std::string& agent_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (configured_ && credentials == credentials_ && agent_id == agent_id_) {
    return;
  }

  const bool replacing = subscriber_ != nullptr;
  if (subscriber_ != nullptr) {
    subscriber_->stop();
    subscriber_.reset();
  }
  credentials_ = credentials;
  agent_id_ = agent_id;
  configured_ = true;
  transport_ = realtime_transport(credentials.url);

  switch (transport_) {
    case RealtimeTransport::supabase: {
      auto endpoint = supabase_socket_endpoint(credentials.url, credentials.key);
      if (!endpoint.has_value() || credentials.key.empty()) {
        core::log_warn("realtime", "incomplete realtime credentials for " + credentials.url + "; relying on heartbeat polling");
        return;
      }
      core::log_info("realtime", replacing ? "credentials changed; reconnecting" : "connecting to " + endpoint->host);
      subscriber_ = make_supabase_subscriber(std::move(*endpoint), credentials.key, agent_id, handlers_, reconnect_delay_);
      break;
    }
    case RealtimeTransport::redis: {
      auto endpoint = parse_redis_url(credentials.url);
      if (!endpoint.has_value()) {
        core::log_warn("realtime", "malformed relay url " + credentials.url + "; relying on heartbeat polling");
        return;
      }
      const std::string secret = credentials.key.empty() ? endpoint->password : credentials.key;
      core::log_info("realtime", replacing ? "credentials changed; reconnecting" : "connecting to relay " + endpoint->host);
      subscriber_ = make_redis_subscriber(std::move(*endpoint), secret, command_channel_name(agent_id), handlers_,
                                          reconnect_delay_);
      break;
    }
    case RealtimeTransport::unsupported:
      core::log_warn("realtime", "unsupported realtime endpoint " + credentials.url + "; relying on heartbeat polling");
      return;
  }
  subscriber_->start();
}

void RealtimeChannel::stop() {
  std::unique_ptr<RealtimeSubscriber> subscriber;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriber = std::move(subscriber_);
    configured_ = false;
  }
  if (subscriber != nullptr) {
    subscriber->stop();
  }
}

bool RealtimeChannel::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriber_ != nullptr;
}

RealtimeTransport RealtimeChannel::transport() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transport_;
}

}  // namespace netmon_agent::api
