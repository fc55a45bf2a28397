#include "discovery/port_scan.hpp"

#include <algorithm>
#include <unordered_map>

#include "core/log.hpp"
#include "core/worker_pool.hpp"
#include "net/tcp.hpp"

namespace netmon_agent::discovery {

const std::vector<std::uint16_t>& common_ports() {
  static const std::vector<std::uint16_t> kCommonPorts = {
      21, 22, 23, 25, 53, 80, 110, 135, 139, 143, 443, 445, 993, 995, 1433, 3306, 3389, 5432, 8080, 8443,
  };
  return kCommonPorts;
}

std::optional<std::string> port_service_name(const std::uint16_t port) {
  static const std::unordered_map<std::uint16_t, std::string> kServices = {
      {21, "ftp"},       {22, "ssh"},          {23, "telnet"},     {25, "smtp"},        {53, "dns"},
      {80, "http"},      {110, "pop3"},        {135, "msrpc"},     {139, "netbios"},    {143, "imap"},
      {443, "https"},    {445, "smb"},         {993, "imaps"},     {995, "pop3s"},      {1433, "mssql"},
      {3306, "mysql"},   {3389, "rdp"},        {5432, "postgresql"}, {8080, "http-alt"}, {8443, "https-alt"},
      {5900, "vnc"},     {6379, "redis"},      {27017, "mongodb"}, {9200, "elasticsearch"}, {161, "snmp"},
      {162, "snmptrap"}, {514, "syslog"},      {1883, "mqtt"},
  };
  const auto it = kServices.find(port);
  if (it == kServices.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::uint16_t> scan_ports(net::TcpConnector& connector, const std::string& ip,
                                      const PortScanOptions& options) {
  const auto& ports = options.ports.empty() ? common_ports() : options.ports;

  const auto results = core::map_bounded(ports, options.concurrency, [&](const std::uint16_t port) {
    return connector.connect(ip, port, options.timeout).open ? 1 : 0;
  });

  std::vector<std::uint16_t> open;
  for (std::size_t i = 0; i < ports.size(); ++i) {
    if (results[i] != 0) {
      open.push_back(ports[i]);
    }
  }
  std::sort(open.begin(), open.end());
  core::log_debug("portscan", ip + ": " + std::to_string(open.size()) + " open ports");
  return open;
}

}  // namespace netmon_agent::discovery
