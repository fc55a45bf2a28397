#include "api/realtime_subscriber.hpp"

#include <deque>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "core/log.hpp"
#include "core/version.hpp"

namespace netmon_agent::api {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

constexpr auto kConnectTimeout = std::chrono::seconds(10);
// The server drops sockets that stay silent for 60 s.
constexpr auto kHeartbeatInterval = std::chrono::seconds(25);
constexpr const char* kJoinRef = "1";

using PlainSocket = websocket::stream<beast::tcp_stream>;
using TlsSocket = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// Supabase Realtime transport: joins the per-agent agent_commands channel and
// turns postgres_changes frames into commands.
class SupabaseSubscriber final : public RealtimeSubscriber {
 public:
  SupabaseSubscriber(SocketEndpoint endpoint, std::string key, std::string agent_id, const RealtimeHandlers& handlers,
                     std::chrono::milliseconds reconnect_delay)
      : RealtimeSubscriber(handlers, reconnect_delay),
        endpoint_(std::move(endpoint)),
        key_(std::move(key)),
        agent_id_(std::move(agent_id)),
        topic_(command_topic(agent_id_)) {}

  ~SupabaseSubscriber() override { stop(); }

  [[nodiscard]] const SocketEndpoint& endpoint() const noexcept { return endpoint_; }
  [[nodiscard]] const std::string& key() const noexcept { return key_; }
  [[nodiscard]] const std::string& agent_id() const noexcept { return agent_id_; }
  [[nodiscard]] const std::string& topic() const noexcept { return topic_; }

  void joined() {
    joined_ = true;
    core::log_info("realtime", "subscribed to " + topic_);
    notify_connection(true);
  }

  void received(model::AgentCommand command) { deliver(std::move(command)); }

 protected:
  void session() override;

  void interrupt() override {
    if (io_ != nullptr) {
      io_->stop();
    }
  }

 private:
  SocketEndpoint endpoint_;
  std::string key_;
  std::string agent_id_;
  std::string topic_;
  asio::io_context* io_{nullptr};
  // Session thread only.
  bool joined_{false};
};

// One WebSocket connection. Every handler runs on the session thread inside
// io_context::run, so no state here is shared.
template <typename Socket>
class PhoenixSession {
 public:
  template <typename... StreamArgs>
  PhoenixSession(SupabaseSubscriber& owner, asio::io_context& io, StreamArgs&&... stream_args)
      : owner_(owner), resolver_(io), heartbeat_(io), ws_(io, std::forward<StreamArgs>(stream_args)...) {}

  PhoenixSession(const PhoenixSession&) = delete;
  PhoenixSession& operator=(const PhoenixSession&) = delete;

  void start() {
    const SocketEndpoint& endpoint = owner_.endpoint();
    resolver_.async_resolve(endpoint.host, endpoint.port,
                            [this](const beast::error_code& ec, const tcp::resolver::results_type& results) {
                              on_resolve(ec, results);
                            });
  }

 private:
  static constexpr bool kTls = std::is_same_v<Socket, TlsSocket>;

  void on_resolve(const beast::error_code& ec, const tcp::resolver::results_type& results) {
    if (ec) {
      return fail("resolve " + owner_.endpoint().host, ec);
    }
    beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
    beast::get_lowest_layer(ws_).async_connect(
        results, [this](const beast::error_code& connect_ec, const tcp::resolver::results_type::endpoint_type&) {
          on_connect(connect_ec);
        });
  }

  void on_connect(const beast::error_code& ec) {
    if (ec) {
      return fail("connect", ec);
    }
    if constexpr (kTls) {
      const std::string& host = owner_.endpoint().host;
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host.c_str())) {
        core::log_warn("realtime", "cannot set TLS server name " + host);
        return finish();
      }
      ws_.next_layer().set_verify_callback(ssl::host_name_verification(host));
      ws_.next_layer().async_handshake(ssl::stream_base::client, [this](const beast::error_code& tls_ec) {
        if (tls_ec) {
          return fail("TLS handshake", tls_ec);
        }
        upgrade();
      });
    } else {
      upgrade();
    }
  }

  void upgrade() {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
      request.set(beast::http::field::user_agent, std::string("netmon-agent/") + core::kAgentVersion);
    }));
    ws_.async_handshake(host_header(), owner_.endpoint().target, [this](const beast::error_code& ec) { on_handshake(ec); });
  }

  void on_handshake(const beast::error_code& ec) {
    if (ec) {
      return fail("WebSocket handshake", ec);
    }
    ws_.text(true);
    send(phoenix_join_message(owner_.agent_id(), owner_.key(), kJoinRef));
    read();
    schedule_heartbeat();
  }

  void read() {
    ws_.async_read(buffer_, [this](const beast::error_code& ec, std::size_t) { on_read(ec); });
  }

  void on_read(const beast::error_code& ec) {
    if (ec) {
      return fail("read", ec);
    }
    const std::string frame = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    handle(frame);
    if (!finished_) {
      read();
    }
  }

  void handle(const std::string& frame) {
    PhoenixEvent event = parse_phoenix_frame(frame, owner_.topic(), kJoinRef);
    switch (event.kind) {
      case PhoenixEvent::Kind::ignored:
        break;
      case PhoenixEvent::Kind::joined:
        owner_.joined();
        break;
      case PhoenixEvent::Kind::join_failed:
        core::log_warn("realtime", "subscription rejected: " + event.detail);
        finish();
        break;
      case PhoenixEvent::Kind::command:
        owner_.received(std::move(*event.command));
        break;
      case PhoenixEvent::Kind::closed:
        core::log_warn("realtime", "channel closed by server (" + event.detail + ")");
        finish();
        break;
      case PhoenixEvent::Kind::heartbeat_reply:
        if (event.detail == pending_heartbeat_) {
          pending_heartbeat_.clear();
        }
        break;
    }
  }

  void schedule_heartbeat() {
    heartbeat_.expires_after(kHeartbeatInterval);
    heartbeat_.async_wait([this](const beast::error_code& ec) {
      if (ec || finished_) {
        return;
      }
      if (!pending_heartbeat_.empty()) {
        core::log_warn("realtime", "heartbeat " + pending_heartbeat_ + " unanswered");
        return finish();
      }
      pending_heartbeat_ = std::to_string(++ref_);
      send(phoenix_heartbeat_message(pending_heartbeat_));
      schedule_heartbeat();
    });
  }

  // One write in flight at a time.
  void send(std::string text) {
    outbox_.push_back(std::move(text));
    if (outbox_.size() == 1) {
      write_next();
    }
  }

  void write_next() {
    ws_.async_write(asio::buffer(outbox_.front()), [this](const beast::error_code& ec, std::size_t) {
      if (ec) {
        return fail("write", ec);
      }
      outbox_.pop_front();
      if (!outbox_.empty() && !finished_) {
        write_next();
      }
    });
  }

  void fail(const std::string& what, const beast::error_code& ec) {
    if (finished_) {
      return;
    }
    if (ec == websocket::error::closed) {
      core::log_warn("realtime", "server closed the connection");
    } else if (ec != asio::error::operation_aborted) {
      core::log_warn("realtime", what + " failed: " + ec.message());
    }
    finish();
  }

  // Cancels everything outstanding; io_context::run returns once the
  // aborted handlers have drained.
  void finish() {
    if (finished_) {
      return;
    }
    finished_ = true;
    resolver_.cancel();
    heartbeat_.cancel();
    beast::get_lowest_layer(ws_).close();
  }

  [[nodiscard]] std::string host_header() const {
    const SocketEndpoint& endpoint = owner_.endpoint();
    const bool default_port = endpoint.port == (kTls ? "443" : "80");
    return default_port ? endpoint.host : endpoint.host + ":" + endpoint.port;
  }

  SupabaseSubscriber& owner_;
  tcp::resolver resolver_;
  asio::steady_timer heartbeat_;
  Socket ws_;
  beast::flat_buffer buffer_{};
  std::deque<std::string> outbox_{};
  std::string pending_heartbeat_{};
  unsigned long ref_{1};
  bool finished_{false};
};

void SupabaseSubscriber::session() {
  asio::io_context io;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    io_ = &io;
  }
  joined_ = false;

  if (endpoint_.tls) {
    ssl::context tls(ssl::context::tls_client);
    tls.set_default_verify_paths();
    tls.set_verify_mode(ssl::verify_peer);
    PhoenixSession<TlsSocket> connection(*this, io, tls);
    connection.start();
    io.run();
  } else {
    PhoenixSession<PlainSocket> connection(*this, io);
    connection.start();
    io.run();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    io_ = nullptr;
  }
  if (joined_) {
    notify_connection(false);
  }
}

}  // namespace

std::unique_ptr<RealtimeSubscriber> make_supabase_subscriber(SocketEndpoint endpoint, std::string key,
                                                             std::string agent_id, const RealtimeHandlers& handlers,
                                                             const std::chrono::milliseconds reconnect_delay) {
  return std::make_unique<SupabaseSubscriber>(std::move(endpoint), std::move(key), std::move(agent_id), handlers,
                                              reconnect_delay);
}

}  // namespace netmon_agent::api
