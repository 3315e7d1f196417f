#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "connection_status.hpp"
#include "log.hpp"
#include "share_error.hpp"

struct SavedConnection {
  std::string id;
  std::string host;
  uint16_t port = 0;
  std::optional<std::string> password;
  std::optional<std::string> display_name;
  uint64_t created_at_ms = 0;
  std::optional<std::string> cached_model_name;
  ConnectionStatus cached_status = ConnectionStatus::Unknown;
  uint64_t last_checked_at_ms = 0;

  std::string endpoint() const { return host + ":" + std::to_string(port); }
  std::string label() const { return display_name.value_or(endpoint()); }
};

nlohmann::json to_json(const SavedConnection& connection);
bool from_json(const nlohmann::json& j, SavedConnection& out, std::string& error);

// Known peers keyed by id, unique by (host, port). Every mutation is written
// to the store file when one is configured. Thread-safe.
class ConnectionRegistry {
public:
  explicit ConnectionRegistry(std::filesystem::path store_path = {},
                              std::shared_ptr<Logger> logger = nullptr);

  // Missing file is not an error.
  bool load(std::string& error);
  ShareError flush() const;

  // Adds `candidate`, or updates the entry with the same host and port in
  // place, keeping its id and creation time.
  SavedConnection upsert(SavedConnection candidate);

  // Replaces endpoint, credentials, name and cached state of `id`.
  ShareResult<SavedConnection> update(const std::string& id, SavedConnection changes);

  bool remove(const std::string& id);

  std::optional<SavedConnection> get(const std::string& id) const;
  std::optional<SavedConnection> find_by_endpoint(const std::string& host, uint16_t port) const;
  std::vector<SavedConnection> list() const;
  // Entries usable as a transcription source: everything but self-connections.
  std::vector<SavedConnection> selectable() const;

  // Stores a probe result. `model` replaces the cached model when set.
  // Returns false when `id` is no longer registered.
  bool record_status(const std::string& id,
                     ConnectionStatus status,
                     const std::optional<std::string>& model,
                     uint64_t checked_at_ms);

  const std::filesystem::path& store_path() const { return store_path_; }

private:
  static std::string normalize_host(const std::string& host);
  std::vector<SavedConnection>::iterator find_locked(const std::string& id);
  std::vector<SavedConnection>::const_iterator find_locked(const std::string& id) const;
  bool save_locked(std::string& error) const;
  void persist_locked() const;

  std::filesystem::path store_path_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<SavedConnection> connections_;
};
