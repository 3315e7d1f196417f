#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "connection_status.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "sharing_client.hpp"

// Periodic and on-demand status probes of every saved connection. Probes run
// concurrently; a new probe for an id cancels the one still in flight.
class HealthMonitor {
public:
  using StatusListener = std::function<void(const std::string& connection_id, ConnectionStatus status)>;

  HealthMonitor(std::shared_ptr<SharingClient> client,
                std::chrono::seconds interval,
                std::shared_ptr<Logger> logger = nullptr);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void start();
  void stop();

  void refresh_all();
  void check_now(const std::string& connection_id);
  void on_focus_regained();

  // Called on a client worker thread after each recorded probe.
  void set_status_listener(StatusListener listener);

  std::size_t in_flight() const;
  uint64_t completed_checks() const;
  uint64_t superseded_checks() const;

private:
  struct Pending {
    uint64_t generation = 0;
    std::shared_ptr<HttpExchange> exchange;
  };

  // Outlives the monitor while probe callbacks are outstanding.
  struct State {
    std::shared_ptr<SharingClient> client;
    std::shared_ptr<Logger> logger;
    mutable std::mutex mutex;
    std::map<std::string, Pending> pending;
    uint64_t next_generation = 0;
    uint64_t completed = 0;
    uint64_t superseded = 0;
    bool stopped = false;
    StatusListener listener;
  };

  void schedule_tick();
  static void on_probe_result(const std::shared_ptr<State>& state,
                              const std::string& connection_id,
                              uint64_t generation,
                              const ShareResult<StatusResponse>& result);

  std::shared_ptr<State> state_;
  std::chrono::seconds interval_;
  asio::io_context io_;
  asio::steady_timer timer_;
  std::thread thread_;
  bool running_ = false;
};
