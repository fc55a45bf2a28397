#include "net/banner.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cctype>

#include "net/socket.hpp"

namespace netmon_agent::net {
namespace {

constexpr const char* kHttpNudge = "HEAD / HTTP/1.0\r\nHost: localhost\r\n\r\n";
constexpr std::chrono::milliseconds kIdleAfterData{500};

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool contains(const std::string& haystack, const char* needle) { return haystack.find(needle) != std::string::npos; }

bool starts_with(const std::string& value, const char* prefix) { return value.rfind(prefix, 0) == 0; }

class SocketBannerGrabber final : public BannerGrabber {
 public:
  std::optional<std::string> grab(const std::string& ip, const std::uint16_t port,
                                  const std::chrono::milliseconds timeout) override {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const Socket socket = connect_tcp(ip, port, timeout);
    if (!socket.valid()) {
      return std::nullopt;
    }

    if (wants_http_nudge(port)) {
      const std::string nudge = kHttpNudge;
      if (::send(socket.fd(), nudge.data(), nudge.size(), MSG_NOSIGNAL) < 0) {
        return std::nullopt;
      }
    }

    std::string data;
    char chunk[kMaxBannerBytes]{};
    while (data.size() < kMaxBannerBytes) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (!data.empty()) {
        remaining = std::min(remaining, kIdleAfterData);
      }
      if (remaining.count() <= 0 || !wait_readable(socket, remaining)) {
        break;
      }
      const ssize_t received = ::recv(socket.fd(), chunk, kMaxBannerBytes - data.size(), 0);
      if (received <= 0) {
        break;
      }
      data.append(chunk, static_cast<std::size_t>(received));
    }

    if (data.empty()) {
      return std::nullopt;
    }
    return data;
  }
};

}  // namespace

bool wants_http_nudge(const std::uint16_t port) noexcept {
  return port == 80 || port == 443 || port == 8080 || port == 8443;
}

std::string first_banner_line(const std::string& raw) {
  std::size_t start = 0;
  while (start < raw.size()) {
    std::size_t end = raw.find_first_of("\r\n", start);
    if (end == std::string::npos) {
      end = raw.size();
    }
    std::string line = raw.substr(start, end - start);
    const auto first = line.find_first_not_of(" \t");
    if (first != std::string::npos) {
      const auto last = line.find_last_not_of(" \t");
      line = line.substr(first, last - first + 1);
      if (line.size() > kMaxBannerLineLength) {
        line.resize(kMaxBannerLineLength);
      }
      return line;
    }
    start = end + 1;
  }
  return {};
}

std::optional<std::string> identify_service(const std::string& banner, const std::uint16_t port) {
  const std::string lower = lowercase(banner);

  if (starts_with(lower, "ssh-")) {
    return "ssh";
  }
  if (starts_with(lower, "220") && (contains(lower, "ftp") || port == 21)) {
    return "ftp";
  }
  if (starts_with(lower, "220") && (contains(lower, "smtp") || contains(lower, "mail") || port == 25)) {
    return "smtp";
  }
  if (starts_with(lower, "http/")) {
    return "http";
  }
  if (contains(lower, "mysql")) {
    return "mysql";
  }
  if (contains(lower, "postgres")) {
    return "postgresql";
  }
  if (contains(lower, "redis")) {
    return "redis";
  }
  if (contains(lower, "mongo")) {
    return "mongodb";
  }
  if (contains(lower, "microsoft") && contains(lower, "sql")) {
    return "mssql";
  }
  if (contains(lower, "imap")) {
    return "imap";
  }
  if (contains(lower, "pop3") || starts_with(lower, "+ok")) {
    return "pop3";
  }
  if (contains(lower, "telnet")) {
    return "telnet";
  }
  if (contains(lower, "vnc") || starts_with(lower, "rfb ")) {
    return "vnc";
  }
  if (contains(lower, "apache") || contains(lower, "nginx") || contains(lower, "server:")) {
    return "http";
  }
  return std::nullopt;
}

std::unique_ptr<BannerGrabber> make_socket_banner_grabber() { return std::make_unique<SocketBannerGrabber>(); }

}  // namespace netmon_agent::net
