#include "firewall_probe.hpp"

#include <fstream>
#include <string>

#include "settings_manager.hpp"
#include "utils.hpp"

SystemFirewallProbe::SystemFirewallProbe(std::filesystem::path ufw_root)
  : ufw_root_(std::move(ufw_root)) {}

FirewallStatus SystemFirewallProbe::probe(uint16_t port) const {
  FirewallStatus status;
  std::ifstream conf(ufw_root_ / "ufw.conf");
  std::string line;
  while(std::getline(conf, line)) {
    line = trim_copy(line);
    if(SettingsManager::to_lower(line) == "enabled=yes") {
      status.enabled = true;
      break;
    }
  }
  if(!status.enabled) return status;

  // ufw stores allow rules as iptables fragments, e.g.
  //   -A ufw-user-input -p tcp --dport 47842 -j ACCEPT
  status.app_allowed = false;
  const std::string needle = "--dport " + std::to_string(port) + " ";
  std::ifstream rules(ufw_root_ / "user.rules");
  while(std::getline(rules, line)) {
    if(line.find(needle) != std::string::npos && line.find("-j ACCEPT") != std::string::npos) {
      status.app_allowed = true;
      break;
    }
  }
  status.may_be_blocked = !status.app_allowed;
  return status;
}
