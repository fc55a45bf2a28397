#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netmon_agent::net::dns {

enum RecordType : std::uint16_t {
  kTypeA = 1,
  kTypePtr = 12,
  kTypeTxt = 16,
  kTypeAaaa = 28,
  kTypeSrv = 33,
  kTypeAny = 255,
};

struct Question {
  std::string name{};
  std::uint16_t type{kTypeA};
  // mDNS QU bit.
  bool unicast_response{false};
};

struct ResourceRecord {
  std::string name{};
  std::uint16_t type{0};
  std::uint32_t ttl{0};
  // A: dotted quad. PTR/SRV: target name.
  std::string data{};
  // SRV only.
  std::uint16_t port{0};
};

struct Message {
  std::uint16_t id{0};
  std::uint16_t flags{0};
  std::uint16_t rcode{0};
  std::vector<Question> questions{};
  // Answer, authority and additional sections in wire order.
  std::vector<ResourceRecord> records{};

  [[nodiscard]] bool is_response() const noexcept { return (flags & 0x8000U) != 0; }
};

std::vector<std::uint8_t> encode_query(std::uint16_t id, const std::vector<Question>& questions, bool recursion_desired);

// Throws std::runtime_error on truncated or malformed input.
Message decode_message(const std::uint8_t* data, std::size_t size);

}  // namespace netmon_agent::net::dns
