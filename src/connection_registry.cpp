#include "connection_registry.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace {
constexpr int kStoreVersion = 1;

template<typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if(value) j[key] = *value;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
  if(!j.contains(key) || !j.at(key).is_string()) return std::nullopt;
  return j.at(key).get<std::string>();
}
} // namespace

nlohmann::json to_json(const SavedConnection& c) {
  nlohmann::json j{
    {"id", c.id},
    {"host", c.host},
    {"port", c.port},
    {"created_at", c.created_at_ms},
    {"cached_status", to_string(c.cached_status)},
    {"last_checked_at", c.last_checked_at_ms}
  };
  put_optional(j, "password", c.password);
  put_optional(j, "display_name", c.display_name);
  put_optional(j, "cached_model", c.cached_model_name);
  return j;
}

bool from_json(const nlohmann::json& j, SavedConnection& out, std::string& error) {
  if(!j.is_object()) {
    error = "connection entry is not an object";
    return false;
  }
  try {
    out.id = j.at("id").get<std::string>();
    out.host = j.at("host").get<std::string>();
    const int port = j.at("port").get<int>();
    if(port <= 0 || port > 65535) {
      error = "invalid port " + std::to_string(port);
      return false;
    }
    out.port = static_cast<uint16_t>(port);
    out.created_at_ms = j.value("created_at", uint64_t{0});
    out.last_checked_at_ms = j.value("last_checked_at", uint64_t{0});
    out.password = optional_string(j, "password");
    out.display_name = optional_string(j, "display_name");
    out.cached_model_name = optional_string(j, "cached_model");
    out.cached_status = connection_status_from_string(j.value("cached_status", std::string("unknown")))
                          .value_or(ConnectionStatus::Unknown);
  } catch(const nlohmann::json::exception& e) {
    error = e.what();
    return false;
  }
  if(out.id.empty() || out.host.empty()) {
    error = "connection entry lacks id or host";
    return false;
  }
  return true;
}

ConnectionRegistry::ConnectionRegistry(std::filesystem::path store_path, std::shared_ptr<Logger> logger)
  : store_path_(std::move(store_path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("registry")) {}

std::string ConnectionRegistry::normalize_host(const std::string& host) {
  std::string out = trim_copy(host);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return out;
}

std::vector<SavedConnection>::iterator ConnectionRegistry::find_locked(const std::string& id) {
  return std::find_if(connections_.begin(), connections_.end(),
                      [&](const SavedConnection& c){ return c.id == id; });
}

std::vector<SavedConnection>::const_iterator ConnectionRegistry::find_locked(const std::string& id) const {
  return std::find_if(connections_.begin(), connections_.end(),
                      [&](const SavedConnection& c){ return c.id == id; });
}

bool ConnectionRegistry::load(std::string& error) {
  if(store_path_.empty()) return true;
  std::ifstream in(store_path_);
  if(!in) return true;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    error = "failed to parse " + store_path_.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object() || !doc.contains("connections") || !doc.at("connections").is_array()) {
    error = store_path_.string() + " has no connections array";
    return false;
  }

  std::vector<SavedConnection> loaded;
  for(const auto& entry : doc.at("connections")) {
    SavedConnection c;
    std::string entry_error;
    if(!from_json(entry, c, entry_error)) {
      log_warn(logger_.get(), "Skipping saved connection: {}", entry_error);
      continue;
    }
    c.host = normalize_host(c.host);
    const bool duplicate = std::any_of(loaded.begin(), loaded.end(), [&](const SavedConnection& o){
      return o.id == c.id || (o.host == c.host && o.port == c.port);
    });
    if(duplicate) {
      log_warn(logger_.get(), "Skipping duplicate saved connection {}", c.endpoint());
      continue;
    }
    loaded.push_back(std::move(c));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  connections_ = std::move(loaded);
  log_debug(logger_.get(), "Loaded {} saved connection(s)", connections_.size());
  return true;
}

bool ConnectionRegistry::save_locked(std::string& error) const {
  if(store_path_.empty()) return true;
  nlohmann::json doc{{"version", kStoreVersion}, {"connections", nlohmann::json::array()}};
  for(const auto& c : connections_) doc["connections"].push_back(to_json(c));

  std::error_code ec;
  if(store_path_.has_parent_path()) {
    std::filesystem::create_directories(store_path_.parent_path(), ec);
  }
  // Write aside and rename so a crash never leaves a truncated store.
  auto tmp = store_path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      error = "unable to write " + tmp.string();
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      error = "short write to " + tmp.string();
      return false;
    }
  }
  std::filesystem::rename(tmp, store_path_, ec);
  if(ec) {
    error = "unable to replace " + store_path_.string() + ": " + ec.message();
    return false;
  }
  return true;
}

void ConnectionRegistry::persist_locked() const {
  std::string error;
  if(!save_locked(error)) {
    log_error(logger_.get(), "Saved connections not persisted: {}", error);
  }
}

ShareError ConnectionRegistry::flush() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string error;
  if(!save_locked(error)) return ShareError(ShareErrc::PersistFailed, error);
  return {};
}

SavedConnection ConnectionRegistry::upsert(SavedConnection candidate) {
  candidate.host = normalize_host(candidate.host);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(connections_.begin(), connections_.end(), [&](const SavedConnection& c){
    return c.host == candidate.host && c.port == candidate.port;
  });
  if(it != connections_.end()) {
    candidate.id = it->id;
    candidate.created_at_ms = it->created_at_ms;
    *it = candidate;
    log_info(logger_.get(), "Updated saved connection {} ({})", candidate.id, candidate.endpoint());
  } else {
    candidate.id = generate_connection_id();
    candidate.created_at_ms = unix_time_ms();
    connections_.push_back(candidate);
    log_info(logger_.get(), "Added saved connection {} ({})", candidate.id, candidate.endpoint());
  }
  persist_locked();
  return candidate;
}

ShareResult<SavedConnection> ConnectionRegistry::update(const std::string& id, SavedConnection changes) {
  changes.host = normalize_host(changes.host);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if(it == connections_.end()) {
    return ShareResult<SavedConnection>::failure(ShareErrc::NotFound, "no saved connection " + id);
  }
  const bool collides = std::any_of(connections_.begin(), connections_.end(), [&](const SavedConnection& c){
    return c.id != id && c.host == changes.host && c.port == changes.port;
  });
  if(collides) {
    return ShareResult<SavedConnection>::failure(ShareErrc::InvalidArgument,
      changes.endpoint() + " is already saved under another id");
  }
  changes.id = it->id;
  changes.created_at_ms = it->created_at_ms;
  *it = changes;
  persist_locked();
  return ShareResult<SavedConnection>::success(changes);
}

bool ConnectionRegistry::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if(it == connections_.end()) return false;
  log_info(logger_.get(), "Removed saved connection {} ({})", it->id, it->endpoint());
  connections_.erase(it);
  persist_locked();
  return true;
}

std::optional<SavedConnection> ConnectionRegistry::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if(it == connections_.end()) return std::nullopt;
  return *it;
}

std::optional<SavedConnection> ConnectionRegistry::find_by_endpoint(const std::string& host, uint16_t port) const {
  const auto wanted = normalize_host(host);
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& c : connections_) {
    if(c.host == wanted && c.port == port) return c;
  }
  return std::nullopt;
}

std::vector<SavedConnection> ConnectionRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_;
}

std::vector<SavedConnection> ConnectionRegistry::selectable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SavedConnection> out;
  for(const auto& c : connections_) {
    if(is_selectable(c.cached_status)) out.push_back(c);
  }
  return out;
}

bool ConnectionRegistry::record_status(const std::string& id,
                                       ConnectionStatus status,
                                       const std::optional<std::string>& model,
                                       uint64_t checked_at_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if(it == connections_.end()) return false;
  if(model && it->cached_model_name != model) {
    log_info(logger_.get(), "{} now serves '{}'", it->label(), *model);
    it->cached_model_name = model;
  }
  it->cached_status = status;
  it->last_checked_at_ms = checked_at_ms;
  persist_locked();
  return true;
}
