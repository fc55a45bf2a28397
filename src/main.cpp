#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "api/http_controller.hpp"
#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/version.hpp"
#include "discovery/discovery.hpp"
#include "discovery/enrichment.hpp"
#include "discovery/oui.hpp"
#include "discovery/source.hpp"
#include "monitor/probe_cascade.hpp"
#include "net/banner.hpp"
#include "net/dns_resolver.hpp"
#include "net/http_client.hpp"
#include "net/interfaces.hpp"
#include "net/ping.hpp"
#include "net/snmp.hpp"
#include "net/tcp.hpp"
#include "net/tls_inspector.hpp"
#include "sinks/ui_sink.hpp"
#include "upgrade/upgrade_trigger.hpp"

namespace {

netmon_agent::core::ProcessSignals g_signals{};

void handle_shutdown_signal(int /*signal*/) {
  g_signals.shutdown = 1;
}

void handle_scan_signal(int /*signal*/) {
  g_signals.scan_now = 1;
}

void handle_ping_signal(int /*signal*/) {
  g_signals.ping = 1;
}

}  // namespace

std::string format_config_settings(const netmon_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | version=" << netmon_agent::core::kAgentVersion
         << " | controller=" << config.controller.url
         << " | heartbeat_interval_s=" << config.heartbeat_interval.count()
         << " | status_check_interval_s=" << config.status_check_interval.count()
         << " | failure_threshold=" << config.status_failure_threshold
         << " | ping_concurrency=" << config.scan.ping_concurrency
         << " | port_scan=" << (config.scan.port_scan ? "true" : "false")
         << " | snmp=" << (config.scan.snmp ? "true" : "false")
         << " | auto_register=" << (config.scan.auto_register ? "true" : "false")
         << " | realtime=" << (config.realtime.enabled ? "true" : "false")
         << " | auto_upgrade=" << (config.upgrade.enabled ? "true" : "false")
         << " | log_level=" << netmon_agent::core::to_string(config.log_level);
  return output.str();
}

int main(int argc, char** argv) {
  namespace core = netmon_agent::core;
  namespace net = netmon_agent::net;
  namespace discovery = netmon_agent::discovery;

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGUSR1, handle_scan_signal);
  std::signal(SIGUSR2, handle_ping_signal);
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "/etc/netmon-agent/agent.yaml";

  core::AgentConfig config{};
  try {
    config = core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  core::set_log_level(config.log_level);
  std::cerr << format_config_settings(config, config_path) << '\n';

  auto http = net::make_curl_http_client(std::string("netmon-agent/") + core::kAgentVersion);
  netmon_agent::api::ControllerOptions controller_options{};
  controller_options.base_url = config.controller.url;
  controller_options.api_key = config.controller.api_key;
  controller_options.timeout = config.controller.request_timeout;
  auto controller = netmon_agent::api::make_http_controller(controller_options, *http);

  auto pinger = net::make_system_pinger();
  auto tcp = net::make_socket_connector();
  auto banners = net::make_socket_banner_grabber();
  auto dns = net::make_udp_resolver();
  auto tls = net::make_openssl_inspector();

  const bool udp_available = discovery::udp_multicast_available();
  std::unique_ptr<net::SnmpClient> snmp{};
  if (udp_available && config.scan.snmp) {
    snmp = net::make_udp_snmp_client();
  } else {
    std::cerr << "[agent] SNMP unavailable or disabled; falling back to none client\n";
    snmp = net::make_none_snmp_client();
  }

  const discovery::OuiDatabase oui = discovery::OuiDatabase::load(config.oui_database);
  std::cerr << "[agent] loaded " << oui.size() << " OUI vendor prefixes\n";

  discovery::DiscoverySources sources{};
  sources.arp = discovery::make_arp_source(oui);
  if (udp_available) {
    std::cerr << "[agent] multicast discovery enabled (mDNS, SSDP)\n";
    sources.mdns = discovery::make_mdns_source();
    sources.ssdp = discovery::make_ssdp_source(*http);
  } else {
    std::cerr << "[agent] UDP sockets unavailable; mDNS and SSDP fall back to none sources\n";
    sources.mdns = discovery::make_none_source("mdns");
    sources.ssdp = discovery::make_none_source("ssdp");
  }

  discovery::DiscoveryOptions discovery_options{};
  discovery_options.ping_concurrency = config.scan.ping_concurrency;
  discovery::DiscoveryEngine engine(discovery_options, *pinger, std::move(sources),
                                    [](const std::string& cidr) { return net::is_local_network(cidr); });

  discovery::EnrichmentOptions enrichment_options{};
  enrichment_options.port_scan = config.scan.port_scan;
  enrichment_options.snmp = config.scan.snmp;
  enrichment_options.snmp_community = config.scan.snmp_community;
  discovery::EnrichmentPipeline enrichment(discovery::EnrichmentCapabilities{*tcp, *banners, *pinger, *snmp},
                                           enrichment_options);

  netmon_agent::monitor::ProbeCascade probes(*pinger, *tcp);
  auto upgrader = netmon_agent::upgrade::make_command_upgrade_trigger(config.upgrade.command);
  auto ui = config.stdout_debug ? netmon_agent::sinks::make_stdout_ui_sink() : netmon_agent::sinks::make_null_ui_sink();

  core::AgentServices services{
      *controller,
      engine,
      enrichment,
      probes,
      netmon_agent::monitor::CheckBackends{*pinger, *tcp, *http, *dns, *tls},
      *upgrader,
      *ui,
      []() { return net::detect_primary_network(net::list_ipv4_interfaces()); },
  };

  core::Agent agent{config, services};
  const core::AgentExit exit = agent.run(g_signals);

  if (!exit.clean) {
    std::cerr << "[agent] exiting with code " << exit.code << " while probes are still in flight\n";
    std::fflush(stdout);
    std::cerr.flush();
    std::_Exit(exit.code);
  }

  std::cerr << "[agent] exiting with code " << exit.code << '\n';
  return exit.code;
}
