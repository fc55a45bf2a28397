#include "net/snmp.hpp"

#include <sys/socket.h>

#include <random>
#include <sstream>
#include <stdexcept>

#include "core/log.hpp"
#include "net/socket.hpp"

namespace netmon_agent::net {
namespace {

constexpr std::uint16_t kSnmpPort = 161;
constexpr std::uint8_t kTagInteger = 0x02;
constexpr std::uint8_t kTagOctetString = 0x04;
constexpr std::uint8_t kTagNull = 0x05;
constexpr std::uint8_t kTagOid = 0x06;
constexpr std::uint8_t kTagSequence = 0x30;
constexpr std::uint8_t kTagGetRequest = 0xA0;
constexpr std::uint8_t kTagGetResponse = 0xA2;
constexpr std::int32_t kSnmpVersion2c = 1;

void put_length(std::vector<std::uint8_t>& out, const std::size_t length) {
  if (length < 0x80) {
    out.push_back(static_cast<std::uint8_t>(length));
  } else if (length <= 0xFF) {
    out.push_back(0x81);
    out.push_back(static_cast<std::uint8_t>(length));
  } else {
    out.push_back(0x82);
    out.push_back(static_cast<std::uint8_t>(length >> 8U));
    out.push_back(static_cast<std::uint8_t>(length & 0xFFU));
  }
}

void put_tlv(std::vector<std::uint8_t>& out, const std::uint8_t tag, const std::vector<std::uint8_t>& value) {
  out.push_back(tag);
  put_length(out, value.size());
  out.insert(out.end(), value.begin(), value.end());
}

std::vector<std::uint8_t> encode_integer(std::int32_t value) {
  std::vector<std::uint8_t> bytes;
  for (int shift = 24; shift >= 0; shift -= 8) {
    bytes.push_back(static_cast<std::uint8_t>((static_cast<std::uint32_t>(value) >> shift) & 0xFFU));
  }
  while (bytes.size() > 1 && ((bytes[0] == 0x00 && (bytes[1] & 0x80U) == 0) ||
                              (bytes[0] == 0xFF && (bytes[1] & 0x80U) != 0))) {
    bytes.erase(bytes.begin());
  }
  return bytes;
}

std::vector<std::uint8_t> encode_oid(const std::string& oid) {
  std::vector<std::uint32_t> arcs;
  std::istringstream input(oid);
  std::string part;
  while (std::getline(input, part, '.')) {
    if (part.empty()) {
      continue;
    }
    arcs.push_back(static_cast<std::uint32_t>(std::stoul(part)));
  }
  if (arcs.size() < 2) {
    throw std::invalid_argument("OID needs at least two arcs: " + oid);
  }

  std::vector<std::uint8_t> bytes;
  bytes.push_back(static_cast<std::uint8_t>(arcs[0] * 40 + arcs[1]));
  for (std::size_t i = 2; i < arcs.size(); ++i) {
    std::uint32_t arc = arcs[i];
    std::vector<std::uint8_t> chunk;
    chunk.push_back(static_cast<std::uint8_t>(arc & 0x7FU));
    arc >>= 7U;
    while (arc > 0) {
      chunk.insert(chunk.begin(), static_cast<std::uint8_t>((arc & 0x7FU) | 0x80U));
      arc >>= 7U;
    }
    bytes.insert(bytes.end(), chunk.begin(), chunk.end());
  }
  return bytes;
}

class BerReader {
 public:
  BerReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  struct Tlv {
    std::uint8_t tag;
    const std::uint8_t* value;
    std::size_t length;
  };

  [[nodiscard]] bool at_end() const noexcept { return offset_ >= size_; }

  Tlv next() {
    require(2);
    const std::uint8_t tag = data_[offset_++];
    std::size_t length = data_[offset_++];
    if ((length & 0x80U) != 0) {
      const std::size_t octets = length & 0x7FU;
      if (octets == 0 || octets > 4) {
        throw std::runtime_error("unsupported BER length");
      }
      require(octets);
      length = 0;
      for (std::size_t i = 0; i < octets; ++i) {
        length = (length << 8U) | data_[offset_++];
      }
    }
    require(length);
    Tlv tlv{tag, data_ + offset_, length};
    offset_ += length;
    return tlv;
  }

  Tlv expect(const std::uint8_t tag) {
    Tlv tlv = next();
    if (tlv.tag != tag) {
      throw std::runtime_error("unexpected BER tag");
    }
    return tlv;
  }

 private:
  void require(std::size_t count) const {
    if (offset_ + count > size_) {
      throw std::runtime_error("truncated BER data");
    }
  }

  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t offset_{0};
};

std::int32_t decode_integer(const BerReader::Tlv& tlv) {
  if (tlv.length == 0 || tlv.length > 4) {
    throw std::runtime_error("unsupported INTEGER length");
  }
  std::int32_t value = (tlv.value[0] & 0x80U) != 0 ? -1 : 0;
  for (std::size_t i = 0; i < tlv.length; ++i) {
    value = static_cast<std::int32_t>((static_cast<std::uint32_t>(value) << 8U) | tlv.value[i]);
  }
  return value;
}

std::string decode_oid(const BerReader::Tlv& tlv) {
  if (tlv.length == 0) {
    throw std::runtime_error("empty OID");
  }
  std::ostringstream out;
  out << (tlv.value[0] / 40) << '.' << (tlv.value[0] % 40);
  std::uint32_t arc = 0;
  for (std::size_t i = 1; i < tlv.length; ++i) {
    arc = (arc << 7U) | (tlv.value[i] & 0x7FU);
    if ((tlv.value[i] & 0x80U) == 0) {
      out << '.' << arc;
      arc = 0;
    }
  }
  return out.str();
}

std::int32_t next_request_id() {
  thread_local std::mt19937 generator{std::random_device{}()};
  return static_cast<std::int32_t>(generator() & 0x7FFFFFFFU);
}

class UdpSnmpClient final : public SnmpClient {
 public:
  std::optional<model::SnmpInfo> query_system(const std::string& ip, const std::string& community,
                                              const std::chrono::milliseconds timeout) override {
    try {
      return query(ip, community, timeout);
    } catch (const std::exception& ex) {
      core::log_debug("snmp", ip + ": " + ex.what());
      return std::nullopt;
    }
  }

 private:
  static std::optional<model::SnmpInfo> query(const std::string& ip, const std::string& community,
                                              const std::chrono::milliseconds timeout) {
    const auto address = resolve_ipv4(ip, kSnmpPort);
    if (!address.has_value()) {
      return std::nullopt;
    }

    const Socket socket = open_udp_socket();
    const std::int32_t request_id = next_request_id();
    const auto packet =
        encode_get_request(community, request_id, {kOidSysDescr, kOidSysName, kOidSysContact, kOidSysLocation});
    if (::sendto(socket.fd(), packet.data(), packet.size(), 0, reinterpret_cast<const sockaddr*>(&*address),
                 sizeof(*address)) < 0) {
      return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::uint8_t buffer[4096]{};
    while (true) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0 || !wait_readable(socket, remaining)) {
        return std::nullopt;
      }
      const ssize_t received = ::recv(socket.fd(), buffer, sizeof(buffer), 0);
      if (received <= 0) {
        continue;
      }
      const SnmpResponse response = decode_response(buffer, static_cast<std::size_t>(received));
      if (response.request_id != request_id) {
        continue;
      }
      if (response.error_status != 0) {
        return std::nullopt;
      }
      return to_snmp_info(response);
    }
  }
};

class NoneSnmpClient final : public SnmpClient {
 public:
  std::optional<model::SnmpInfo> query_system(const std::string&, const std::string&,
                                              std::chrono::milliseconds) override {
    return std::nullopt;
  }
};

}  // namespace

std::vector<std::uint8_t> encode_get_request(const std::string& community, const std::int32_t request_id,
                                             const std::vector<std::string>& oids) {
  std::vector<std::uint8_t> varbinds;
  for (const auto& oid : oids) {
    std::vector<std::uint8_t> varbind;
    put_tlv(varbind, kTagOid, encode_oid(oid));
    put_tlv(varbind, kTagNull, {});
    put_tlv(varbinds, kTagSequence, varbind);
  }

  std::vector<std::uint8_t> pdu;
  put_tlv(pdu, kTagInteger, encode_integer(request_id));
  put_tlv(pdu, kTagInteger, encode_integer(0));
  put_tlv(pdu, kTagInteger, encode_integer(0));
  put_tlv(pdu, kTagSequence, varbinds);

  std::vector<std::uint8_t> message;
  put_tlv(message, kTagInteger, encode_integer(kSnmpVersion2c));
  put_tlv(message, kTagOctetString, std::vector<std::uint8_t>(community.begin(), community.end()));
  put_tlv(message, kTagGetRequest, pdu);

  std::vector<std::uint8_t> out;
  put_tlv(out, kTagSequence, message);
  return out;
}

SnmpResponse decode_response(const std::uint8_t* data, const std::size_t size) {
  BerReader outer(data, size);
  const auto message_tlv = outer.expect(kTagSequence);

  BerReader message(message_tlv.value, message_tlv.length);
  message.expect(kTagInteger);
  message.expect(kTagOctetString);
  const auto pdu_tlv = message.expect(kTagGetResponse);

  BerReader pdu(pdu_tlv.value, pdu_tlv.length);
  SnmpResponse response{};
  response.request_id = decode_integer(pdu.expect(kTagInteger));
  response.error_status = decode_integer(pdu.expect(kTagInteger));
  pdu.expect(kTagInteger);
  const auto list_tlv = pdu.expect(kTagSequence);

  BerReader list(list_tlv.value, list_tlv.length);
  while (!list.at_end()) {
    const auto varbind_tlv = list.expect(kTagSequence);
    BerReader varbind(varbind_tlv.value, varbind_tlv.length);
    SnmpVarbind entry{};
    entry.oid = decode_oid(varbind.expect(kTagOid));
    const auto value = varbind.next();
    if (value.tag == kTagOctetString) {
      entry.value = std::string(reinterpret_cast<const char*>(value.value), value.length);
    }
    response.varbinds.push_back(std::move(entry));
  }
  return response;
}

std::optional<model::SnmpInfo> to_snmp_info(const SnmpResponse& response) {
  model::SnmpInfo info{};
  bool any = false;
  for (const auto& varbind : response.varbinds) {
    if (!varbind.value.has_value()) {
      continue;
    }
    if (varbind.oid == kOidSysDescr) {
      info.sys_descr = varbind.value;
    } else if (varbind.oid == kOidSysName) {
      info.sys_name = varbind.value;
    } else if (varbind.oid == kOidSysContact) {
      info.sys_contact = varbind.value;
    } else if (varbind.oid == kOidSysLocation) {
      info.sys_location = varbind.value;
    } else {
      continue;
    }
    any = true;
  }
  if (!any) {
    return std::nullopt;
  }
  return info;
}

std::unique_ptr<SnmpClient> make_udp_snmp_client() { return std::make_unique<UdpSnmpClient>(); }

std::unique_ptr<SnmpClient> make_none_snmp_client() { return std::make_unique<NoneSnmpClient>(); }

}  // namespace netmon_agent::net
