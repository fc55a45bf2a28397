#include "api/realtime_subscriber.hpp"

#include <string>
#include <utility>

#include <sys/socket.h>

#include <hiredis/hiredis.h>

#include "core/log.hpp"

namespace netmon_agent::api {
namespace {

constexpr long kConnectTimeoutSeconds = 5;

struct ContextDeleter {
  void operator()(redisContext* context) const {
    if (context != nullptr) {
      redisFree(context);
    }
  }
};

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

// Relay transport: SUBSCRIBE to one channel whose messages are change
// payloads {type, record, old_record?}.
class RedisSubscriber final : public RealtimeSubscriber {
 public:
  RedisSubscriber(RedisEndpoint endpoint, std::string secret, std::string channel, const RealtimeHandlers& handlers,
                  std::chrono::milliseconds reconnect_delay)
      : RealtimeSubscriber(handlers, reconnect_delay),
        endpoint_(std::move(endpoint)),
        secret_(std::move(secret)),
        channel_(std::move(channel)) {}

  ~RedisSubscriber() override { stop(); }

 protected:
  void session() override {
    timeval timeout{};
    timeout.tv_sec = kConnectTimeoutSeconds;

    std::unique_ptr<redisContext, ContextDeleter> context(
        redisConnectWithTimeout(endpoint_.host.c_str(), static_cast<int>(endpoint_.port), timeout));
    if (context == nullptr || context->err != REDIS_OK) {
      core::log_warn("realtime", std::string("connect failed: ") + (context != nullptr ? context->errstr : "out of memory"));
      return;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return;
      }
      context_ = context.get();
    }

    subscribe_and_listen(context.get());

    std::lock_guard<std::mutex> lock(mutex_);
    context_ = nullptr;
  }

  void interrupt() override {
    // Unblocks a pending redisGetReply.
    if (context_ != nullptr && context_->fd >= 0) {
      ::shutdown(context_->fd, SHUT_RDWR);
    }
  }

 private:
  void subscribe_and_listen(redisContext* context) {
    if (!secret_.empty()) {
      ReplyPtr auth(static_cast<redisReply*>(redisCommand(context, "AUTH %s", secret_.c_str())));
      if (auth == nullptr || auth->type == REDIS_REPLY_ERROR) {
        core::log_warn("realtime", "AUTH rejected");
        return;
      }
    }

    ReplyPtr subscribed(static_cast<redisReply*>(redisCommand(context, "SUBSCRIBE %s", channel_.c_str())));
    if (subscribed == nullptr || subscribed->type == REDIS_REPLY_ERROR) {
      core::log_warn("realtime", "SUBSCRIBE " + channel_ + " failed");
      return;
    }

    core::log_info("realtime", "subscribed to " + channel_);
    notify_connection(true);

    while (!stopping()) {
      void* raw = nullptr;
      if (redisGetReply(context, &raw) != REDIS_OK) {
        break;
      }
      ReplyPtr reply(static_cast<redisReply*>(raw));
      handle_reply(*reply);
    }

    if (!stopping()) {
      core::log_warn("realtime", std::string("disconnected: ") + (context->errstr[0] != '\0' ? context->errstr : "connection closed"));
    }
    notify_connection(false);
  }

  void handle_reply(const redisReply& reply) {
    if (reply.type != REDIS_REPLY_ARRAY || reply.elements != 3) {
      return;
    }
    const redisReply* kind = reply.element[0];
    const redisReply* payload = reply.element[2];
    if (kind == nullptr || kind->str == nullptr || std::string(kind->str, kind->len) != "message" || payload == nullptr ||
        payload->str == nullptr) {
      return;
    }

    auto command = parse_realtime_message(std::string(payload->str, payload->len));
    if (!command.has_value()) {
      core::log_debug("realtime", "ignoring message on " + channel_);
      return;
    }
    deliver(std::move(*command));
  }

  RedisEndpoint endpoint_;
  std::string secret_;
  std::string channel_;
  redisContext* context_{nullptr};
};

}  // namespace

std::unique_ptr<RealtimeSubscriber> make_redis_subscriber(RedisEndpoint endpoint, std::string secret,
                                                          std::string channel, const RealtimeHandlers& handlers,
                                                          const std::chrono::milliseconds reconnect_delay) {
  return std::make_unique<RedisSubscriber>(std::move(endpoint), std::move(secret), std::move(channel), handlers,
                                           reconnect_delay);
}

}  // namespace netmon_agent::api
