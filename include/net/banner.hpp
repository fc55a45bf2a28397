#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace netmon_agent::net {

inline constexpr std::size_t kMaxBannerBytes = 512;
inline constexpr std::size_t kMaxBannerLineLength = 256;

// Raw banner read capability. Returns nullopt when nothing was read.
class BannerGrabber {
 public:
  virtual std::optional<std::string> grab(const std::string& ip, std::uint16_t port, std::chrono::milliseconds timeout) = 0;
  virtual ~BannerGrabber() = default;
};

// Web ports get an HTTP HEAD nudge because servers there do not speak first.
[[nodiscard]] bool wants_http_nudge(std::uint16_t port) noexcept;

// First non-empty line, trimmed and capped at kMaxBannerLineLength.
[[nodiscard]] std::string first_banner_line(const std::string& raw);

// Service name inferred from banner text, e.g. "SSH-2.0-OpenSSH_9.6" -> "ssh".
[[nodiscard]] std::optional<std::string> identify_service(const std::string& banner, std::uint16_t port);

std::unique_ptr<BannerGrabber> make_socket_banner_grabber();

}  // namespace netmon_agent::net
