#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Either a remote connection or the local model is the transcription source,
// never both. `local_model` is remembered while a remote is active.
struct ActiveSelection {
  std::optional<std::string> remote_connection_id;
  std::string local_model;

  bool is_remote() const { return remote_connection_id.has_value(); }
};

using SelectionListenerHandle = std::size_t;

class SelectionService {
public:
  using Listener = std::function<void(const ActiveSelection&)>;

  virtual ~SelectionService() = default;

  virtual ActiveSelection get_active() const = 0;
  // Selecting a local model clears any remote selection.
  virtual void set_local_model(const std::string& model) = 0;
  // nullopt returns to the local model.
  virtual void set_active_remote(const std::optional<std::string>& connection_id) = 0;

  virtual SelectionListenerHandle add_listener(Listener listener) = 0;
  virtual void remove_listener(SelectionListenerHandle handle) = 0;
};

// In-process selection. Listeners run on the thread making the change, after
// the internal lock is released.
class LocalSelectionService : public SelectionService {
public:
  using PersistHook = std::function<void(const ActiveSelection&)>;

  explicit LocalSelectionService(ActiveSelection initial = {}, PersistHook persist = nullptr);

  ActiveSelection get_active() const override;
  void set_local_model(const std::string& model) override;
  void set_active_remote(const std::optional<std::string>& connection_id) override;

  SelectionListenerHandle add_listener(Listener listener) override;
  void remove_listener(SelectionListenerHandle handle) override;

private:
  void publish(const ActiveSelection& selection);

  mutable std::mutex mutex_;
  ActiveSelection current_;
  PersistHook persist_;
  std::map<SelectionListenerHandle, Listener> listeners_;
  SelectionListenerHandle next_handle_ = 1;
};
