#include "net/cidr.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace netmon_agent::net {

std::optional<std::uint32_t> parse_ipv4(const std::string& text) {
  std::uint32_t address = 0;
  std::size_t octet_count = 0;
  std::size_t position = 0;

  while (position <= text.size()) {
    const std::size_t dot = text.find('.', position);
    const std::size_t end = dot == std::string::npos ? text.size() : dot;
    if (end == position || end - position > 3) {
      return std::nullopt;
    }

    unsigned int octet = 0;
    const auto result = std::from_chars(text.data() + position, text.data() + end, octet);
    if (result.ec != std::errc{} || result.ptr != text.data() + end || octet > 255) {
      return std::nullopt;
    }

    address = (address << 8U) | octet;
    ++octet_count;
    if (dot == std::string::npos) {
      break;
    }
    position = dot + 1;
  }

  if (octet_count != 4) {
    return std::nullopt;
  }
  return address;
}

std::string format_ipv4(const std::uint32_t address) {
  std::ostringstream out;
  out << ((address >> 24U) & 0xFFU) << '.' << ((address >> 16U) & 0xFFU) << '.' << ((address >> 8U) & 0xFFU) << '.'
      << (address & 0xFFU);
  return out.str();
}

std::uint32_t prefix_to_mask(const int prefix) noexcept {
  if (prefix <= 0) {
    return 0;
  }
  if (prefix >= 32) {
    return 0xFFFFFFFFU;
  }
  return ~((1U << (32 - prefix)) - 1U);
}

Ipv4Network parse_cidr(const std::string& cidr) {
  const auto slash = cidr.find('/');
  const std::string address_text = cidr.substr(0, slash);
  const auto address = parse_ipv4(address_text);
  if (!address.has_value()) {
    throw std::invalid_argument("invalid IP address: " + address_text);
  }

  int prefix = 32;
  if (slash != std::string::npos) {
    const std::string prefix_text = cidr.substr(slash + 1);
    const auto result = std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
    if (prefix_text.empty() || result.ec != std::errc{} || result.ptr != prefix_text.data() + prefix_text.size()) {
      throw std::invalid_argument("invalid CIDR prefix: " + prefix_text);
    }
  }
  if (prefix < 0 || prefix > 32) {
    throw std::invalid_argument("invalid CIDR prefix: " + std::to_string(prefix));
  }

  return Ipv4Network{.address = *address, .mask = prefix_to_mask(prefix), .prefix = prefix};
}

std::vector<std::string> expand_cidr(const std::string& cidr) {
  const Ipv4Network network = parse_cidr(cidr);

  std::uint64_t first = network.network();
  std::uint64_t last = network.broadcast();
  if (network.prefix <= 30) {
    ++first;
    --last;
  }

  std::vector<std::string> addresses;
  addresses.reserve(static_cast<std::size_t>(last - first + 1));
  for (std::uint64_t value = first; value <= last; ++value) {
    addresses.push_back(format_ipv4(static_cast<std::uint32_t>(value)));
  }
  return addresses;
}

std::size_t cidr_host_count(const std::string& cidr) {
  const Ipv4Network network = parse_cidr(cidr);
  const std::uint64_t total = std::uint64_t{1} << (32 - network.prefix);
  return static_cast<std::size_t>(network.prefix <= 30 ? total - 2 : total);
}

bool is_in_cidr(const std::string& ip, const std::string& cidr) {
  const auto address = parse_ipv4(ip);
  if (!address.has_value()) {
    return false;
  }
  try {
    const Ipv4Network network = parse_cidr(cidr);
    return (*address & network.mask) == network.network();
  } catch (const std::invalid_argument&) {
    return false;
  }
}

bool networks_overlap(const Ipv4Network& lhs, const Ipv4Network& rhs) noexcept {
  const bool rhs_in_lhs = (rhs.address & lhs.mask) == lhs.network();
  const bool lhs_in_rhs = (lhs.address & rhs.mask) == rhs.network();
  return rhs_in_lhs || lhs_in_rhs;
}

std::string normalize_mac(const std::string& mac) {
  std::string hex;
  hex.reserve(12);
  for (const char c : mac) {
    if (c == ':' || c == '-') {
      continue;
    }
    hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  if (hex.size() != 12) {
    return mac;
  }
  for (const char c : hex) {
    if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
      return mac;
    }
  }

  std::string normalized;
  normalized.reserve(17);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    if (i != 0) {
      normalized.push_back(':');
    }
    normalized.append(hex, i, 2);
  }
  return normalized;
}

bool is_network_or_broadcast_suffix(const std::string& ip) {
  const auto ends_with = [&ip](const std::string& suffix) {
    return ip.size() >= suffix.size() && ip.compare(ip.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  return ends_with(".0") || ends_with(".255");
}

}  // namespace netmon_agent::net
