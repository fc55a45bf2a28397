#pragma once

#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace netmon_agent::net {

// Owning file descriptor for a socket.
class Socket {
 public:
  Socket() = default;
  explicit Socket(int fd) noexcept : fd_(fd) {}
  ~Socket();

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  void reset() noexcept;

 private:
  int fd_{-1};
};

// IPv4 only. Accepts dotted quads and host names.
[[nodiscard]] std::optional<sockaddr_in> resolve_ipv4(const std::string& host, std::uint16_t port);

// Non-blocking connect bounded by timeout. Returns an invalid socket and fills
// error on failure. The returned socket is left in blocking mode.
Socket connect_tcp(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout,
                   std::string* error = nullptr);

// Throws std::runtime_error when the socket cannot be created.
Socket open_udp_socket();

// Applies SO_RCVTIMEO and SO_SNDTIMEO.
void set_io_timeout(const Socket& socket, std::chrono::milliseconds timeout);

[[nodiscard]] bool wait_readable(const Socket& socket, std::chrono::milliseconds timeout);

}  // namespace netmon_agent::net
