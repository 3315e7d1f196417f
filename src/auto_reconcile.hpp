#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "selection_service.hpp"
#include "share_error.hpp"
#include "sharing_server.hpp"

struct SharingConfig {
  uint16_t port = 0;
  std::optional<std::string> password;
  std::optional<std::string> display_name;
};

// Keeps a running sharing session in step with the local selection: restarts
// it when the local model changes, pauses it while a remote source is active
// and brings it back when the user returns to local. A failed restart leaves
// sharing stopped and is reported once.
class AutoReconcile {
public:
  enum class Outcome { None, Restarted, StoppedForRemote, Restored, Failed };
  using FailureCallback = std::function<void(const ShareError&)>;
  using ChangeCallback = std::function<void(Outcome, const SharingSession&)>;

  AutoReconcile(std::shared_ptr<SharingServer> server,
                std::shared_ptr<SelectionService> selection,
                std::shared_ptr<Logger> logger = nullptr);
  ~AutoReconcile();

  AutoReconcile(const AutoReconcile&) = delete;
  AutoReconcile& operator=(const AutoReconcile&) = delete;

  void start(std::chrono::milliseconds poll_interval = std::chrono::seconds(2));
  void stop();
  void notify();

  Outcome reconcile_once();

  // Runs `fn` between cycles. Manual start and stop go through here so a
  // cycle never acts on a session snapshot they have since replaced.
  void run_exclusive(const std::function<void()>& fn);

  void set_failure_callback(FailureCallback callback);
  void set_change_callback(ChangeCallback callback);

  // Config restored the next time the selection is local while stopped.
  void remember(SharingConfig config);
  std::optional<SharingConfig> remembered() const;
  void forget();
  std::optional<ShareError> last_error() const;
  uint64_t cycles() const;

private:
  void loop(std::chrono::milliseconds poll_interval);
  Outcome fail(const std::string& action, const ShareError& cause);
  static SharingConfig config_of(const SharingSession& session);

  std::shared_ptr<SharingServer> server_;
  std::shared_ptr<SelectionService> selection_;
  std::shared_ptr<Logger> logger_;
  SelectionListenerHandle listener_handle_ = 0;

  std::mutex reconcile_mutex_;
  mutable std::mutex state_mutex_;
  std::optional<SharingConfig> remembered_;
  std::optional<ShareError> last_error_;
  uint64_t cycles_ = 0;
  FailureCallback on_failure_;
  ChangeCallback on_change_;

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool wake_requested_ = false;
  bool stopping_ = false;
  std::thread thread_;
};

const char* to_string(AutoReconcile::Outcome outcome);
