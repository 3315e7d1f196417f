#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "auto_reconcile.hpp"
#include "binding_resolver.hpp"
#include "connection_registry.hpp"
#include "firewall_probe.hpp"
#include "health_monitor.hpp"
#include "inference_gate.hpp"
#include "log.hpp"
#include "model_inventory.hpp"
#include "selection_service.hpp"
#include "share_error.hpp"
#include "sharing_client.hpp"
#include "sharing_server.hpp"
#include "transcription_engine.hpp"

class ShareCLI;
class SettingsManager;

struct TranscriptionOutcome {
  std::string text;
  std::string model_used;
  uint64_t duration_ms = 0;
  bool remote = false;
  std::string source;   // connection label or "local"
};

class SharingEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool start_cli_thread = false;
    bool start_health_monitor = true;
    bool auto_start_sharing = true;
    std::chrono::milliseconds reconcile_poll{2000};
    InterfaceLister interfaces;    // empty uses list_local_interfaces
  };

  // Anything left empty is built from settings.
  struct Collaborators {
    std::shared_ptr<TranscriptionEngine> engine;
    std::shared_ptr<ModelInventory> inventory;
    std::shared_ptr<FirewallProbe> firewall;
    std::string machine_id;
  };

  SharingEngine(std::shared_ptr<SettingsManager> settings, Options options, Collaborators collaborators = {});
  ~SharingEngine();

  void start();
  // Blocks until request_stop().
  void run();
  void request_stop();
  void stop();

  void execute_command(const std::string& line);

  ShareResult<SharingSession> start_sharing(std::optional<uint16_t> port = std::nullopt,
                                            std::optional<std::string> password = std::nullopt,
                                            std::optional<std::string> display_name = std::nullopt);
  ShareError stop_sharing();
  SharingSession sharing_status() const;
  std::optional<FirewallStatus> probe_firewall() const;

  ShareResult<SavedConnection> add_connection(const std::string& host,
                                              uint16_t port,
                                              std::optional<std::string> password,
                                              std::optional<std::string> display_name);
  ShareResult<SavedConnection> update_connection(const std::string& id,
                                                 const std::string& host,
                                                 uint16_t port,
                                                 std::optional<std::string> password,
                                                 std::optional<std::string> display_name);
  ShareError remove_connection(const std::string& id);
  ShareResult<StatusResponse> test_saved_connection(const std::string& id);
  ShareResult<StatusResponse> test_connection(const std::string& host,
                                              uint16_t port,
                                              const std::optional<std::string>& password);
  std::vector<SavedConnection> connections() const;
  void refresh_connections();
  // Status as it should be shown now, with stale entries reading Unknown.
  ConnectionStatus display_status(const SavedConnection& connection) const;

  ShareError use_remote(const std::string& id);
  void use_local();
  ShareError select_model(const std::string& name);
  ActiveSelection active_selection() const;
  std::vector<std::string> local_models() const;

  ShareResult<TranscriptionOutcome> transcribe(std::vector<uint8_t> audio, const TranscriptionContext& context);
  ShareResult<TranscriptionOutcome> transcribe_file(const std::filesystem::path& path,
                                                    TranscriptionContext::Source source);

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::mutex& settings_mutex() const { return settings_mutex_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<SharingServer> server() const { return server_; }
  std::shared_ptr<SharingClient> client() const { return client_; }
  std::shared_ptr<ConnectionRegistry> registry() const { return registry_; }
  std::shared_ptr<HealthMonitor> health() const { return health_; }
  std::shared_ptr<AutoReconcile> reconcile() const { return reconcile_; }
  std::shared_ptr<InferenceGate> gate() const { return gate_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  void ensure_workspace() const;
  void build_collaborators();
  void persist_selection(const ActiveSelection& selection);
  void persist_sharing(bool enabled, const SharingSession* session);
  void on_status_change(const std::string& id, ConnectionStatus status);
  void auto_start_sharing();
  ShareResult<TranscriptionOutcome> transcribe_locally(const std::vector<uint8_t>& audio);

  Options options_;
  Collaborators collaborators_;
  std::shared_ptr<SettingsManager> settings_;
  mutable std::mutex settings_mutex_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<InferenceGate> gate_;
  std::shared_ptr<LocalSelectionService> selection_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SharingServer> server_;
  std::shared_ptr<SharingClient> client_;
  std::shared_ptr<HealthMonitor> health_;
  std::shared_ptr<AutoReconcile> reconcile_;
  std::unique_ptr<ShareCLI> cli_;

  bool started_ = false;
  std::mutex run_mutex_;
  std::condition_variable run_cv_;
  bool stop_requested_ = false;
};
