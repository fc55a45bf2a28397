#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "net/banner.hpp"
#include "net/cidr.hpp"
#include "net/dns_message.hpp"
#include "net/interfaces.hpp"
#include "net/ping.hpp"
#include "net/snmp.hpp"

namespace dns = netmon_agent::net::dns;
using netmon_agent::net::InterfaceAddress;
using netmon_agent::net::cidr_host_count;
using netmon_agent::net::detect_primary_network;
using netmon_agent::net::expand_cidr;
using netmon_agent::net::first_banner_line;
using netmon_agent::net::identify_service;
using netmon_agent::net::is_in_cidr;
using netmon_agent::net::is_local_network;
using netmon_agent::net::is_network_or_broadcast_suffix;
using netmon_agent::net::normalize_mac;
using netmon_agent::net::parse_cidr;
using netmon_agent::net::parse_ipv4;
using netmon_agent::net::parse_ping_output;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::uint32_t ip(const char* text) { return *parse_ipv4(text); }

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
  out.push_back(static_cast<std::uint8_t>(value >> 8U));
  out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
}

void put_name(std::vector<std::uint8_t>& out, const std::vector<std::string>& labels) {
  for (const auto& label : labels) {
    out.push_back(static_cast<std::uint8_t>(label.size()));
    out.insert(out.end(), label.begin(), label.end());
  }
  out.push_back(0);
}

int test_cidr_expansion() {
  const auto slash30 = expand_cidr("10.0.0.0/30");
  if (slash30.size() != 2 || slash30[0] != "10.0.0.1" || slash30[1] != "10.0.0.2") {
    return fail("test_cidr_expansion", "/30 should expand to the two usable hosts");
  }

  const auto slash24 = expand_cidr("192.168.1.77/24");
  if (slash24.size() != 254 || slash24.front() != "192.168.1.1" || slash24.back() != "192.168.1.254") {
    return fail("test_cidr_expansion", "/24 should exclude network and broadcast");
  }

  if (expand_cidr("10.0.0.4/31").size() != 2 || expand_cidr("10.0.0.9/32").size() != 1) {
    return fail("test_cidr_expansion", "/31 and /32 keep every address");
  }
  if (cidr_host_count("10.0.0.0/16") != 65534) {
    return fail("test_cidr_expansion", "/16 host count mismatch");
  }

  for (const char* bad : {"10.0.0/24", "10.0.0.0/33", "300.1.1.1/24", "10.0.0.0/", "abc"}) {
    try {
      (void)parse_cidr(bad);
      return fail("test_cidr_expansion", "malformed CIDR should throw");
    } catch (const std::invalid_argument&) {
    }
  }
  return 0;
}

int test_cidr_membership_and_overlap() {
  if (!is_in_cidr("192.168.1.20", "192.168.1.0/24") || is_in_cidr("192.168.2.20", "192.168.1.0/24")) {
    return fail("test_cidr_membership_and_overlap", "membership check failed");
  }
  if (is_in_cidr("not-an-ip", "192.168.1.0/24") || is_in_cidr("192.168.1.20", "garbage")) {
    return fail("test_cidr_membership_and_overlap", "malformed input should not match");
  }

  const std::vector<InterfaceAddress> interfaces = {
      InterfaceAddress{.name = "lo", .address = ip("127.0.0.1"), .netmask = ip("255.0.0.0"), .loopback = true},
      InterfaceAddress{.name = "eth0", .address = ip("192.168.1.10"), .netmask = ip("255.255.255.0")},
  };
  if (!is_local_network("192.168.1.0/24", interfaces)) {
    return fail("test_cidr_membership_and_overlap", "same network should be local");
  }
  if (!is_local_network("192.168.0.0/16", interfaces)) {
    return fail("test_cidr_membership_and_overlap", "supernet of an interface network should be local");
  }
  if (!is_local_network("192.168.1.128/25", interfaces)) {
    return fail("test_cidr_membership_and_overlap", "subnet of an interface network should be local");
  }
  if (is_local_network("10.20.0.0/16", interfaces)) {
    return fail("test_cidr_membership_and_overlap", "unrelated network should be remote");
  }
  if (is_local_network("bogus/99", interfaces)) {
    return fail("test_cidr_membership_and_overlap", "malformed CIDR should be treated as remote");
  }
  return 0;
}

int test_primary_network_detection() {
  const std::vector<InterfaceAddress> interfaces = {
      InterfaceAddress{.name = "lo", .address = ip("127.0.0.1"), .netmask = ip("255.0.0.0"), .loopback = true},
      InterfaceAddress{.name = "docker0", .address = ip("172.17.0.1"), .netmask = ip("255.255.0.0")},
      InterfaceAddress{.name = "wlp2s0", .address = ip("169.254.3.4"), .netmask = ip("255.255.0.0")},
      InterfaceAddress{.name = "enp3s0", .address = ip("10.1.2.33"), .netmask = ip("255.255.255.0")},
  };
  const auto primary = detect_primary_network(interfaces);
  if (!primary.has_value() || primary->interface_name != "enp3s0" || primary->ip_address != "10.1.2.33" ||
      primary->cidr != "10.1.2.0/24") {
    return fail("test_primary_network_detection", "physical interface should win");
  }

  const std::vector<InterfaceAddress> virtual_only = {
      InterfaceAddress{.name = "docker0", .address = ip("172.17.0.1"), .netmask = ip("255.255.0.0")},
  };
  if (detect_primary_network(virtual_only).has_value()) {
    return fail("test_primary_network_detection", "virtual bridges should be skipped");
  }
  return 0;
}

int test_mac_and_suffix_helpers() {
  if (normalize_mac("aa-bb-cc-01-02-03") != "AA:BB:CC:01:02:03" || normalize_mac("aabbcc010203") != "AA:BB:CC:01:02:03") {
    return fail("test_mac_and_suffix_helpers", "MAC normalization failed");
  }
  if (normalize_mac("zz:zz") != "zz:zz") {
    return fail("test_mac_and_suffix_helpers", "unparseable MAC should be returned unchanged");
  }
  if (!is_network_or_broadcast_suffix("10.0.0.0") || !is_network_or_broadcast_suffix("10.0.0.255") ||
      is_network_or_broadcast_suffix("10.0.0.25") || is_network_or_broadcast_suffix("10.0.0.10")) {
    return fail("test_mac_and_suffix_helpers", ".0/.255 suffix check failed");
  }
  return 0;
}

int test_ping_output_parsing() {
  const std::string linux_output =
      "PING 10.0.0.1 (10.0.0.1) 56(84) bytes of data.\n"
      "64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time=0.412 ms\n\n"
      "--- 10.0.0.1 ping statistics ---\n1 packets transmitted, 1 received, 0% packet loss, time 0ms\n";
  const auto alive = parse_ping_output(linux_output);
  if (!alive.alive || !alive.ttl.has_value() || *alive.ttl != 64 || !alive.time_ms.has_value() ||
      *alive.time_ms < 0.41 || *alive.time_ms > 0.42) {
    return fail("test_ping_output_parsing", "successful echo should report ttl and time");
  }

  const auto windows_ttl = parse_ping_output("Reply from 10.0.0.2: bytes from time<1ms TTL=128\n");
  if (!windows_ttl.alive || !windows_ttl.ttl.has_value() || *windows_ttl.ttl != 128) {
    return fail("test_ping_output_parsing", "uppercase TTL should parse");
  }

  const auto dead = parse_ping_output("1 packets transmitted, 0 received, 100% packet loss\n");
  if (dead.alive || dead.time_ms.has_value()) {
    return fail("test_ping_output_parsing", "lost echo should not be alive");
  }
  return 0;
}

int test_banner_helpers() {
  if (first_banner_line("\r\n  SSH-2.0-OpenSSH_9.6  \r\nrest") != "SSH-2.0-OpenSSH_9.6") {
    return fail("test_banner_helpers", "first non-empty line should be trimmed");
  }
  if (first_banner_line(std::string(1000, 'x')).size() != netmon_agent::net::kMaxBannerLineLength) {
    return fail("test_banner_helpers", "banner line should be capped");
  }
  if (identify_service("SSH-2.0-OpenSSH_9.6", 2222) != std::optional<std::string>("ssh")) {
    return fail("test_banner_helpers", "ssh banner not recognized");
  }
  if (identify_service("220 ProFTPD Server ready", 2121) != std::optional<std::string>("ftp")) {
    return fail("test_banner_helpers", "ftp banner not recognized");
  }
  if (identify_service("220 mail.example.com ESMTP Postfix", 587) != std::optional<std::string>("smtp")) {
    return fail("test_banner_helpers", "smtp banner not recognized");
  }
  if (identify_service("HTTP/1.1 200 OK", 8080) != std::optional<std::string>("http")) {
    return fail("test_banner_helpers", "http banner not recognized");
  }
  if (!netmon_agent::net::wants_http_nudge(8443) || netmon_agent::net::wants_http_nudge(22)) {
    return fail("test_banner_helpers", "http nudge port set mismatch");
  }
  return 0;
}

int test_dns_message_decoding() {
  std::vector<std::uint8_t> packet;
  put_u16(packet, 0x1234);
  put_u16(packet, 0x8400);
  put_u16(packet, 0);
  put_u16(packet, 2);
  put_u16(packet, 0);
  put_u16(packet, 0);

  // printer.local A 192.168.1.50
  put_name(packet, {"printer", "local"});
  put_u16(packet, dns::kTypeA);
  put_u16(packet, 0x8001);
  packet.insert(packet.end(), {0, 0, 0, 120});
  put_u16(packet, 4);
  packet.insert(packet.end(), {192, 168, 1, 50});

  // _ipp._tcp.local PTR -> pointer back to "printer.local" at offset 12
  put_name(packet, {"_ipp", "_tcp", "local"});
  put_u16(packet, dns::kTypePtr);
  put_u16(packet, 0x0001);
  packet.insert(packet.end(), {0, 0, 0, 120});
  put_u16(packet, 2);
  packet.insert(packet.end(), {0xC0, 12});

  const auto message = dns::decode_message(packet.data(), packet.size());
  if (!message.is_response() || message.id != 0x1234 || message.records.size() != 2) {
    return fail("test_dns_message_decoding", "header or record count mismatch");
  }
  if (message.records[0].name != "printer.local" || message.records[0].data != "192.168.1.50") {
    return fail("test_dns_message_decoding", "A record mismatch");
  }
  if (message.records[1].type != dns::kTypePtr || message.records[1].data != "printer.local") {
    return fail("test_dns_message_decoding", "compressed PTR target mismatch");
  }

  const auto query = dns::encode_query(7, {dns::Question{.name = "example.com", .type = dns::kTypeA}}, true);
  const auto decoded = dns::decode_message(query.data(), query.size());
  if (decoded.is_response() || decoded.questions.size() != 1 || decoded.questions[0].name != "example.com") {
    return fail("test_dns_message_decoding", "encoded query should carry its question");
  }

  try {
    const std::vector<std::uint8_t> truncated(packet.begin(), packet.begin() + 20);
    (void)dns::decode_message(truncated.data(), truncated.size());
    return fail("test_dns_message_decoding", "truncated message should throw");
  } catch (const std::runtime_error&) {
  }
  return 0;
}

int test_snmp_response_decoding() {
  // GetResponse, request-id 7, varbind sysName.0 = "sw1".
  const std::vector<std::uint8_t> packet = {
      0x30, 0x29, 0x02, 0x01, 0x01, 0x04, 0x06, 'p',  'u',  'b',  'l',  'i',  'c',  0xA2, 0x1C, 0x02,
      0x01, 0x07, 0x02, 0x01, 0x00, 0x02, 0x01, 0x00, 0x30, 0x11, 0x30, 0x0F, 0x06, 0x08, 0x2B, 0x06,
      0x01, 0x02, 0x01, 0x01, 0x05, 0x00, 0x04, 0x03, 's',  'w',  '1',
  };
  const auto response = netmon_agent::net::decode_response(packet.data(), packet.size());
  if (response.request_id != 7 || response.error_status != 0 || response.varbinds.size() != 1) {
    return fail("test_snmp_response_decoding", "PDU header mismatch");
  }
  if (response.varbinds[0].oid != netmon_agent::net::kOidSysName) {
    return fail("test_snmp_response_decoding", "OID decode mismatch");
  }

  const auto info = netmon_agent::net::to_snmp_info(response);
  if (!info.has_value() || info->sys_name != std::optional<std::string>("sw1") || info->sys_descr.has_value()) {
    return fail("test_snmp_response_decoding", "sysName should map onto SnmpInfo");
  }

  // A request is not a response.
  const auto request = netmon_agent::net::encode_get_request("public", 1, {netmon_agent::net::kOidSysDescr});
  try {
    (void)netmon_agent::net::decode_response(request.data(), request.size());
    return fail("test_snmp_response_decoding", "GetRequest PDU should be rejected");
  } catch (const std::runtime_error&) {
  }

  const std::vector<std::uint8_t> truncated(packet.begin(), packet.begin() + 30);
  try {
    (void)netmon_agent::net::decode_response(truncated.data(), truncated.size());
    return fail("test_snmp_response_decoding", "truncated BER should throw");
  } catch (const std::runtime_error&) {
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_cidr_expansion(); rc != 0) {
    return rc;
  }
  if (int rc = test_cidr_membership_and_overlap(); rc != 0) {
    return rc;
  }
  if (int rc = test_primary_network_detection(); rc != 0) {
    return rc;
  }
  if (int rc = test_mac_and_suffix_helpers(); rc != 0) {
    return rc;
  }
  if (int rc = test_ping_output_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_banner_helpers(); rc != 0) {
    return rc;
  }
  if (int rc = test_dns_message_decoding(); rc != 0) {
    return rc;
  }
  if (int rc = test_snmp_response_decoding(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] net unit tests\n";
  return 0;
}
