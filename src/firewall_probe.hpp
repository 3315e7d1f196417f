#pragma once

#include <cstdint>
#include <filesystem>

// Advisory only: a blocked verdict never prevents sharing from starting.
struct FirewallStatus {
  bool enabled = false;
  bool app_allowed = true;
  bool may_be_blocked = false;
};

class FirewallProbe {
public:
  virtual ~FirewallProbe() = default;
  virtual FirewallStatus probe(uint16_t port) const = 0;
};

// Reads ufw's configuration; other firewalls are reported as disabled.
class SystemFirewallProbe : public FirewallProbe {
public:
  explicit SystemFirewallProbe(std::filesystem::path ufw_root = "/etc/ufw");
  FirewallStatus probe(uint16_t port) const override;

private:
  std::filesystem::path ufw_root_;
};
