#include "binding_resolver.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <set>

std::vector<InterfaceAddress> list_local_interfaces() {
  std::vector<InterfaceAddress> out;
  struct ifaddrs* ifaddr = nullptr;
  if(getifaddrs(&ifaddr) != 0) {
    log_warn(nullptr, "getifaddrs failed; only loopback will be bound");
    return out;
  }
  for(struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if(!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    const uint32_t host_order = ntohl(sin->sin_addr.s_addr);
    if((host_order >> 24) == 127) continue;            // loopback
    if((host_order >> 16) == ((169u << 8) | 254u)) continue; // link-local
    char buf[INET_ADDRSTRLEN] = {0};
    if(!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
    out.push_back({ifa->ifa_name ? ifa->ifa_name : "", buf});
  }
  freeifaddrs(ifaddr);
  return out;
}

BindingResolver::BindingResolver(InterfaceLister lister, std::shared_ptr<Logger> logger)
  : lister_(lister ? std::move(lister) : InterfaceLister(list_local_interfaces)),
    logger_(std::move(logger)) {}

BoundListener BindingResolver::bind_one(const ServerFactory& make_server,
                                        const std::string& address,
                                        uint16_t port) const {
  BoundListener bound;
  bound.result.address = address;

  in_addr parsed{};
  if(inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
    bound.result.error = "invalid address";
    return bound;
  }

  auto server = make_server();
  // Plain SO_REUSEADDR so a port held by another process is reported busy.
  server->set_socket_options([](socket_t sock){
    int yes = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const void*>(&yes), sizeof(yes));
  });

  errno = 0;
  bool ok = false;
  int bound_port = port;
  if(port == 0) {
    bound_port = server->bind_to_any_port(address);
    ok = bound_port > 0;
  } else {
    ok = server->bind_to_port(address, port);
  }
  if(ok) {
    bound.result.success = true;
    bound.port = static_cast<uint16_t>(bound_port);
    bound.server = std::move(server);
    return bound;
  }
  bound.result.error = errno != 0 ? std::strerror(errno) : "bind failed";
  return bound;
}

std::vector<BoundListener> BindingResolver::resolve_and_bind(const ServerFactory& make_server, uint16_t port) const {
  std::vector<std::string> addresses;
  std::set<std::string> seen;
  for(const auto& iface : lister_()) {
    if(iface.address.empty() || iface.address == kLoopbackAddress) continue;
    if(seen.insert(iface.address).second) addresses.push_back(iface.address);
  }
  addresses.push_back(kLoopbackAddress);

  std::vector<BoundListener> listeners;
  listeners.reserve(addresses.size());
  uint16_t effective_port = port;
  for(const auto& address : addresses) {
    auto bound = bind_one(make_server, address, effective_port);
    if(bound.result.success) {
      if(effective_port == 0) effective_port = bound.port;
      log_info(logger_.get(), "Listening on {}:{}", address, effective_port);
    } else {
      log_warn(logger_.get(), "Bind failed on {}:{}: {}", address, effective_port, bound.result.error);
    }
    listeners.push_back(std::move(bound));
  }
  return listeners;
}

std::vector<BindingResult> BindingResolver::results_of(const std::vector<BoundListener>& listeners) {
  std::vector<BindingResult> out;
  out.reserve(listeners.size());
  for(const auto& listener : listeners) out.push_back(listener.result);
  return out;
}
