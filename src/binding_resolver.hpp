#pragma once
#include <httplib.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "share_error.hpp"

struct InterfaceAddress {
  std::string name;     // e.g. "eth0"
  std::string address;  // numeric IPv4
};

using InterfaceLister = std::function<std::vector<InterfaceAddress>()>;

// Non-loopback, non-link-local IPv4 addresses, read fresh on every call.
std::vector<InterfaceAddress> list_local_interfaces();

inline constexpr const char* kLoopbackAddress = "127.0.0.1";

struct BoundListener {
  BindingResult result;
  uint16_t port = 0;
  std::unique_ptr<httplib::Server> server; // null when the bind failed
};

// Builds a server with its routes installed, ready to bind.
using ServerFactory = std::function<std::unique_ptr<httplib::Server>()>;

class BindingResolver {
public:
  explicit BindingResolver(InterfaceLister lister = list_local_interfaces,
                           std::shared_ptr<Logger> logger = nullptr);

  // One entry per enumerated interface plus loopback, in enumeration order
  // with loopback last. Each bind is attempted independently. With port 0
  // the first successful bind picks the port and the rest reuse it.
  std::vector<BoundListener> resolve_and_bind(const ServerFactory& make_server, uint16_t port) const;

  static std::vector<BindingResult> results_of(const std::vector<BoundListener>& listeners);

private:
  BoundListener bind_one(const ServerFactory& make_server, const std::string& address, uint16_t port) const;

  InterfaceLister lister_;
  std::shared_ptr<Logger> logger_;
};
