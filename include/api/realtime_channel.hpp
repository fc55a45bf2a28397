#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "model/command.hpp"

namespace netmon_agent::api {

// The heartbeat's supabase_url / supabase_anon_key, or the local
// realtime.url / realtime.key fallback.
struct RealtimeCredentials {
  std::string url{};
  std::string key{};
};

bool operator==(const RealtimeCredentials& lhs, const RealtimeCredentials& rhs);
bool operator!=(const RealtimeCredentials& lhs, const RealtimeCredentials& rhs);

enum class RealtimeTransport : std::uint8_t {
  unsupported = 0,
  // Supabase Realtime: Phoenix channels over a WebSocket.
  supabase,
  // Redis pub/sub relay.
  redis,
};

// http/https/ws/wss select Supabase Realtime, redis selects the relay.
[[nodiscard]] RealtimeTransport realtime_transport(const std::string& url);

struct SocketEndpoint {
  bool tls{true};
  std::string host{};
  std::string port{"443"};
  // Request target, e.g. /realtime/v1/websocket?apikey=...&vsn=1.0.0
  std::string target{};
};

// Maps a Supabase project URL to its Realtime WebSocket endpoint.
// https://ref.supabase.co -> wss://ref.supabase.co:443/realtime/v1/websocket?apikey=<key>&vsn=1.0.0
[[nodiscard]] std::optional<SocketEndpoint> supabase_socket_endpoint(const std::string& url, const std::string& key);

struct RedisEndpoint {
  std::string host{};
  std::uint16_t port{6379};
  // Inline password from redis://:secret@host; the credential key wins when both are set.
  std::string password{};
};

// redis://[:password@]host[:port][/db]. Anything else is unsupported.
[[nodiscard]] std::optional<RedisEndpoint> parse_redis_url(const std::string& url);

// Redis relay channel for an agent.
[[nodiscard]] std::string command_channel_name(const std::string& agent_id);

// Phoenix topic of the per-agent agent_commands subscription.
[[nodiscard]] std::string command_topic(const std::string& agent_id);

// phx_join for command_topic(agent_id) asking for INSERT and UPDATE changes on
// public.agent_commands filtered to this agent.
[[nodiscard]] std::string phoenix_join_message(const std::string& agent_id, const std::string& access_token,
                                               const std::string& ref);
[[nodiscard]] std::string phoenix_heartbeat_message(const std::string& ref);

// Decodes one change payload {type, record, old_record?}. Returns the command
// when it should run: an INSERT in pending state, or an UPDATE that moved it
// into pending. Malformed payloads return nullopt.
[[nodiscard]] std::optional<model::AgentCommand> parse_realtime_message(const std::string& payload);

struct PhoenixEvent {
  enum class Kind : std::uint8_t {
    ignored = 0,
    joined,
    join_failed,
    command,
    closed,
    // Reply on the phoenix topic; detail carries its ref.
    heartbeat_reply,
  };

  Kind kind{Kind::ignored};
  std::optional<model::AgentCommand> command{};
  std::string detail{};
};

// Classifies one server frame for the subscription joined with join_ref.
[[nodiscard]] PhoenixEvent parse_phoenix_frame(const std::string& frame, const std::string& topic,
                                               const std::string& join_ref);

struct RealtimeHandlers {
  std::function<void(model::AgentCommand)> on_command{};
  std::function<void(bool connected)> on_connection_change{};
};

class RealtimeSubscriber;

// Push command channel. Each credential set gets its own subscriber with its
// own connection and thread; a change tears the old one down completely.
class RealtimeChannel {
 public:
  explicit RealtimeChannel(RealtimeHandlers handlers,
                           std::chrono::milliseconds reconnect_delay = std::chrono::seconds(5));
  ~RealtimeChannel();

  RealtimeChannel(const RealtimeChannel&) = delete;
  RealtimeChannel& operator=(const RealtimeChannel&) = delete;

  // Starts the subscriber, or replaces it when the credentials or agent changed.
  void update(const RealtimeCredentials& credentials, const std::string& agent_id);
  void stop();

  [[nodiscard]] bool running() const;
  [[nodiscard]] RealtimeTransport transport() const;

 private:
  RealtimeHandlers handlers_;
  std::chrono::milliseconds reconnect_delay_;
  mutable std::mutex mutex_{};
  std::unique_ptr<RealtimeSubscriber> subscriber_{};
  RealtimeTransport transport_{RealtimeTransport::unsupported};
  RealtimeCredentials credentials_{};
  std::string agent_id_{};
  bool configured_{false};
};

}  // namespace netmon_agent::api
