#include "net/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace netmon_agent::net {
namespace {

void set_error(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

}  // namespace

Socket::~Socket() { reset(); }

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    reset();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void Socket::reset() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::optional<sockaddr_in> resolve_ipv4(const std::string& host, const std::uint16_t port) {
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) == 1) {
    return address;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  if (getaddrinfo(host.c_str(), nullptr, &hints, &results) != 0 || results == nullptr) {
    return std::nullopt;
  }

  address.sin_addr = reinterpret_cast<const sockaddr_in*>(results->ai_addr)->sin_addr;
  freeaddrinfo(results);
  return address;
}

Socket connect_tcp(const std::string& host, const std::uint16_t port, const std::chrono::milliseconds timeout,
                   std::string* error) {
  const auto address = resolve_ipv4(host, port);
  if (!address.has_value()) {
    set_error(error, "unable to resolve " + host);
    return Socket{};
  }

  Socket socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!socket.valid()) {
    set_error(error, std::string("socket: ") + std::strerror(errno));
    return Socket{};
  }

  const int flags = fcntl(socket.fd(), F_GETFL, 0);
  if (flags < 0 || fcntl(socket.fd(), F_SETFL, flags | O_NONBLOCK) != 0) {
    set_error(error, "unable to set O_NONBLOCK");
    return Socket{};
  }

  const int rc = ::connect(socket.fd(), reinterpret_cast<const sockaddr*>(&*address), sizeof(*address));
  if (rc != 0 && errno != EINPROGRESS) {
    set_error(error, std::strerror(errno));
    return Socket{};
  }

  if (rc != 0) {
    pollfd descriptor{.fd = socket.fd(), .events = POLLOUT, .revents = 0};
    int ready = 0;
    do {
      ready = poll(&descriptor, 1, static_cast<int>(timeout.count()));
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
      set_error(error, "timeout");
      return Socket{};
    }
    if (ready < 0) {
      set_error(error, std::strerror(errno));
      return Socket{};
    }

    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (getsockopt(socket.fd(), SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0 || socket_error != 0) {
      set_error(error, std::strerror(socket_error != 0 ? socket_error : errno));
      return Socket{};
    }
  }

  fcntl(socket.fd(), F_SETFL, flags);
  return socket;
}

Socket open_udp_socket() {
  Socket socket(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (!socket.valid()) {
    throw std::runtime_error(std::string("udp socket: ") + std::strerror(errno));
  }
  return socket;
}

void set_io_timeout(const Socket& socket, const std::chrono::milliseconds timeout) {
  timeval value{};
  value.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  value.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  setsockopt(socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &value, sizeof(value));
  setsockopt(socket.fd(), SOL_SOCKET, SO_SNDTIMEO, &value, sizeof(value));
}

bool wait_readable(const Socket& socket, const std::chrono::milliseconds timeout) {
  pollfd descriptor{.fd = socket.fd(), .events = POLLIN, .revents = 0};
  int ready = 0;
  do {
    ready = poll(&descriptor, 1, static_cast<int>(std::max<std::int64_t>(0, timeout.count())));
  } while (ready < 0 && errno == EINTR);
  return ready > 0;
}

}  // namespace netmon_agent::net
