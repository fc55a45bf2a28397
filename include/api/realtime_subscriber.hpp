#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "api/realtime_channel.hpp"

namespace netmon_agent::api {

// One push-channel connection owner. run() loops connect, subscribe and listen
// sessions on a private thread with a fixed delay between them until stop().
class RealtimeSubscriber {
 public:
  RealtimeSubscriber(const RealtimeHandlers& handlers, std::chrono::milliseconds reconnect_delay);
  virtual ~RealtimeSubscriber();

  RealtimeSubscriber(const RealtimeSubscriber&) = delete;
  RealtimeSubscriber& operator=(const RealtimeSubscriber&) = delete;

  void start();
  // Idempotent. Derived destructors call it before their members go away.
  void stop();

 protected:
  // One session; returns when the connection ends or interrupt() was called.
  virtual void session() = 0;
  // Unblocks a running session. Called with mutex_ held.
  virtual void interrupt() = 0;

  [[nodiscard]] bool stopping() const;
  void deliver(model::AgentCommand command);
  void notify_connection(bool connected);

  mutable std::mutex mutex_{};
  bool stopping_{false};

 private:
  void run();

  const RealtimeHandlers& handlers_;
  std::chrono::milliseconds reconnect_delay_;
  std::condition_variable cv_{};
  std::thread thread_{};
};

std::unique_ptr<RealtimeSubscriber> make_supabase_subscriber(SocketEndpoint endpoint, std::string key,
                                                             std::string agent_id, const RealtimeHandlers& handlers,
                                                             std::chrono::milliseconds reconnect_delay);

std::unique_ptr<RealtimeSubscriber> make_redis_subscriber(RedisEndpoint endpoint, std::string secret,
                                                          std::string channel, const RealtimeHandlers& handlers,
                                                          std::chrono::milliseconds reconnect_delay);

}  // namespace netmon_agent::api
