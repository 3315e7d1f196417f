#include "selection_service.hpp"

#include <vector>

LocalSelectionService::LocalSelectionService(ActiveSelection initial, PersistHook persist)
  : current_(std::move(initial)), persist_(std::move(persist)) {}

ActiveSelection LocalSelectionService::get_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void LocalSelectionService::set_local_model(const std::string& model) {
  ActiveSelection snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(current_.local_model == model && !current_.is_remote()) return;
    current_.local_model = model;
    current_.remote_connection_id.reset();
    snapshot = current_;
  }
  publish(snapshot);
}

void LocalSelectionService::set_active_remote(const std::optional<std::string>& connection_id) {
  ActiveSelection snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(current_.remote_connection_id == connection_id) return;
    current_.remote_connection_id = connection_id;
    snapshot = current_;
  }
  publish(snapshot);
}

SelectionListenerHandle LocalSelectionService::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto handle = next_handle_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void LocalSelectionService::remove_listener(SelectionListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void LocalSelectionService::publish(const ActiveSelection& selection) {
  if(persist_) persist_(selection);
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  for(auto& listener : snapshot) listener(selection);
}
