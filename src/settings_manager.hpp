#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","sharing_enabled"},   {"aliases", {"share","se"}},        {"type","bool"},   {"default",false},   {"description","Share the local model on the network at startup"}, {"persistent", true}},
  {{"key","sharing_port"},      {"aliases", {"port","p"}},          {"type","int"},    {"default",47842},   {"description","TCP port the sharing server listens on"}, {"persistent", true}},
  {{"key","sharing_password"},  {"aliases", {"password","pw"}},     {"type","string"}, {"default",""},      {"description","Shared secret required in X-VoiceTypr-Key (empty = no auth)"}, {"persistent", true}},
  {{"key","display_name"},      {"aliases", {"name","dn"}},         {"type","string"}, {"default",""},      {"description","Name advertised to peers (empty = host name)"}, {"persistent", true}},
  {{"key","current_model"},     {"aliases", {"model","m"}},         {"type","string"}, {"default",""},      {"description","Locally selected model (empty = first downloaded)"}, {"persistent", true}},
  {{"key","active_remote_id"},  {"aliases", {"remote","ar"}},       {"type","string"}, {"default",""},      {"description","Saved connection used as transcription source"}, {"persistent", true}},
  {{"key","model_dir"},         {"aliases", {"models","md"}},       {"type","string"}, {"default","models"},{"description","Directory holding ggml-<name>.bin models"}, {"persistent", true}},
  {{"key","engine_command"},    {"aliases", {"engine","ec"}},       {"type","string"}, {"default","whisper-cli -nt -np -m {model} -f {audio}"}, {"description","Inference command; {model} and {audio} are substituted"}, {"persistent", true}},
  {{"key","health_interval_s"}, {"aliases", {"health","hi"}},       {"type","int"},    {"default",30},      {"description","Seconds between background health checks"}, {"persistent", true}},
  {{"key","status_timeout_s"},  {"aliases", {"probe_timeout","st"}},{"type","int"},    {"default",10},      {"description","Timeout for status probes in seconds"}, {"persistent", true}},
  {{"key","stale_after_s"},     {"aliases", {"stale","sa"}},        {"type","int"},    {"default",90},      {"description","Cached status older than this reads as unknown"}, {"persistent", true}},
  {{"key","inference_threads"}, {"aliases", {"threads","it"}},      {"type","int"},    {"default",4},       {"description","Worker threads queueing transcription requests"}, {"persistent", true}},
  {{"key","verbose"},           {"aliases", {"v"}},                 {"type","bool"},   {"default",false},   {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},              {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},   {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},              {"aliases", {"persist"}},           {"type","bool"},   {"default",false},   {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed key/value settings described by a JSON specification table and
// persisted as a JSON object. Not synchronized; owners serialize access.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }
  bool has_settings_path() const { return !settings_path_.empty(); }

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_text(const SettingSpec& spec, const std::string& text, std::string& error) const;

  std::vector<SettingSpec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(to_lower(spec.key) == lowered) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::store(const SettingSpec& spec,
                                   const nlohmann::json& value,
                                   std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      values_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      values_[spec.key] = value.get<int>() != 0;
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      values_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      values_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_text(const SettingSpec& spec,
                                                  const std::string& text,
                                                  std::string& error) const {
  error.clear();
  const std::string clean = trim_copy(text);
  if(spec.type == "bool") {
    const std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters in integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*spec, value, error);
  if(!error.empty()) return false;
  return store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
