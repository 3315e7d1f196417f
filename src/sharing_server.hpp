#pragma once
#include <httplib.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "binding_resolver.hpp"
#include "firewall_probe.hpp"
#include "inference_gate.hpp"
#include "log.hpp"
#include "model_inventory.hpp"
#include "selection_service.hpp"
#include "share_error.hpp"
#include "transcription_engine.hpp"

struct SharingSession {
  bool enabled = false;
  uint16_t port = 0;
  std::optional<std::string> password;
  std::string display_name;
  std::string model_name;
  std::size_t active_connection_count = 0;
  std::size_t queued_request_count = 0;
  std::vector<BindingResult> binding_results;
};

struct ServerDependencies {
  std::shared_ptr<TranscriptionEngine> engine;
  std::shared_ptr<ModelInventory> inventory;
  std::shared_ptr<SelectionService> selection;
  // Shared with local transcription so the two never run inference together.
  std::shared_ptr<InferenceGate> gate;
  std::shared_ptr<FirewallProbe> firewall;   // optional
  InterfaceLister interfaces;                // defaults to list_local_interfaces
  std::string machine_id;
  // Request threads per listener; requests beyond the first wait on the gate.
  std::size_t inference_threads = 4;
};

// Serves the locally selected model over HTTP on every local interface.
// start/stop/status are safe to call from any thread.
class SharingServer {
public:
  explicit SharingServer(ServerDependencies deps, std::shared_ptr<Logger> logger = nullptr);
  ~SharingServer();

  SharingServer(const SharingServer&) = delete;
  SharingServer& operator=(const SharingServer&) = delete;

  ShareResult<SharingSession> start(uint16_t port,
                                    std::optional<std::string> password = std::nullopt,
                                    std::optional<std::string> display_name = std::nullopt);
  // Stopping a stopped server succeeds.
  ShareError stop();
  SharingSession status() const;

  // Model start() would advertise right now: the selected local model when
  // it is downloaded, the first downloaded model when nothing is selected.
  std::optional<std::string> resolve_model() const;
  std::optional<FirewallStatus> last_firewall_status() const;
  const std::string& machine_id() const { return deps_.machine_id; }

  // Constant-time comparison against the configured password; an unset
  // password admits every request.
  static bool authorized(const std::optional<std::string>& password, const httplib::Request& request);

private:
  struct Listener {
    std::string address;
    std::unique_ptr<httplib::Server> server;
    std::thread thread;
  };

  std::unique_ptr<httplib::Server> make_server();
  SharingSession snapshot() const;
  void handle_status(const httplib::Request& req, httplib::Response& res);
  void handle_transcribe(const httplib::Request& req, httplib::Response& res);

  ServerDependencies deps_;
  std::shared_ptr<Logger> logger_;

  std::mutex lifecycle_mutex_;
  mutable std::mutex session_mutex_;
  SharingSession session_;
  std::optional<FirewallStatus> firewall_status_;

  std::vector<Listener> listeners_;
};
