#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "binding_resolver.hpp"
#include "settings_manager.hpp"
#include "sharing_engine.hpp"
#include "utils.hpp"

class ShareCLI {
public:
  explicit ShareCLI(SharingEngine& engine)
    : engine_(engine), running_(true), finished_(false) {}

  ~ShareCLI() {
    stop();
  }

  void start() {
    if(cli_thread_.joinable()) return;
    cli_thread_ = std::thread([this](){
      run_loop();
      finished_ = true;
      engine_.request_stop();
    });
  }

  // A loop still blocked on stdin is left to end with the process.
  void stop() {
    running_ = false;
    if(!cli_thread_.joinable()) return;
    if(finished_ && std::this_thread::get_id() != cli_thread_.get_id()) {
      cli_thread_.join();
    } else {
      cli_thread_.detach();
    }
  }

  // Returns false once the user asked to quit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    std::string args;
    std::getline(iss, args);
    trim(args);

    if(cmd.empty()) return true;
    if(cmd == "share") {
      handle_share_command(args);
    } else if(cmd == "ips") {
      list_ips();
    } else if(cmd == "firewall") {
      show_firewall();
    } else if(cmd == "servers" || cmd == "connections") {
      list_servers();
    } else if(cmd == "add") {
      handle_add(args);
    } else if(cmd == "update") {
      handle_update(args);
    } else if(cmd == "remove" || cmd == "rm") {
      handle_remove(args);
    } else if(cmd == "test") {
      handle_test(args);
    } else if(cmd == "refresh") {
      engine_.refresh_connections();
      std::cout << "Refreshing " << engine_.connections().size() << " connection(s)...\n";
    } else if(cmd == "use") {
      handle_use(args);
    } else if(cmd == "model") {
      handle_model(args);
    } else if(cmd == "models") {
      list_models();
    } else if(cmd == "transcribe" || cmd == "t") {
      handle_transcribe(args);
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "save") {
      handle_settings_command("save");
    } else if(cmd == "load") {
      handle_settings_command("load");
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      std::cout << "Quitting...\n";
      running_ = false;
      return false;
    } else {
      print_help();
      std::cout << "Unknown command: " << cmd << "\n";
    }
    return true;
  }

private:
  SharingEngine& engine_;
  std::atomic<bool> running_;
  std::atomic<bool> finished_;
  std::thread cli_thread_;

  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) break;
      std::string line = *input;
      trim(line);
      if(line.empty()) continue;
      if(!execute_command(line)) break;
    }
  }

  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    std::cout << prompt << std::flush;
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  static void trim(std::string& s) {
    s = trim_copy(s);
  }

  static std::vector<std::string> split_args(const std::string& args) {
    std::istringstream iss(args);
    std::vector<std::string> out;
    std::string token;
    while(iss >> token) out.push_back(token);
    return out;
  }

  static std::optional<uint16_t> parse_port(const std::string& text) {
    try {
      std::size_t consumed = 0;
      int value = std::stoi(text, &consumed);
      if(consumed != text.size() || value <= 0 || value > 65535) return std::nullopt;
      return static_cast<uint16_t>(value);
    } catch(const std::exception&) {
      return std::nullopt;
    }
  }

  static std::string format_time(uint64_t unix_ms) {
    if(unix_ms == 0) return "never";
    std::time_t t = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
  }

  static void print_error(const ShareError& error) {
    std::cout << "Error [" << to_string(error.code) << "]: " << error.message << "\n";
    for(const auto& binding : error.binding_results) {
      std::cout << "  " << binding.address << ": " << (binding.success ? "ok" : binding.error) << "\n";
    }
  }

  void print_help() {
    std::cout << "Commands:\n"
              << "  share start [port] [password]   Share the local model on the network\n"
              << "  share stop | share status\n"
              << "  ips                             Local addresses peers can use\n"
              << "  firewall                        Check whether the firewall may block peers\n"
              << "  servers                         List saved connections\n"
              << "  add <host> [port] [password] [name]\n"
              << "  update <id> <host> [port] [password] [name]\n"
              << "  remove <id>\n"
              << "  test <id> | test <host> [port] [password]\n"
              << "  refresh                         Re-check every saved connection\n"
              << "  use <id> | use local            Choose the transcription source\n"
              << "  model [name] | models           Show or choose the local model\n"
              << "  transcribe <file> [live|upload]\n"
              << "  settings [list|get|set|save|load], set, get, save, load\n"
              << "  help, quit\n";
  }

  void print_session(const SharingSession& session) {
    if(!session.enabled) {
      std::cout << "Sharing: off\n";
      return;
    }
    std::cout << "Sharing: on, port " << session.port
              << ", name '" << session.display_name << "'"
              << ", model '" << session.model_name << "'"
              << ", " << (session.password ? "password required" : "no password") << "\n";
    std::cout << "  in progress: " << session.active_connection_count
              << ", queued: " << session.queued_request_count << "\n";
    for(const auto& binding : session.binding_results) {
      std::cout << "  " << binding.address << ":" << session.port << "  "
                << (binding.success ? "listening" : "failed: " + binding.error) << "\n";
    }
  }

  void handle_share_command(const std::string& args) {
    auto parts = split_args(args);
    const std::string action = parts.empty() ? "status" : parts[0];
    if(action == "start") {
      std::optional<uint16_t> port;
      std::optional<std::string> password;
      if(parts.size() > 1) {
        port = parse_port(parts[1]);
        if(!port) {
          std::cout << "Invalid port '" << parts[1] << "'.\n";
          return;
        }
      }
      if(parts.size() > 2) password = parts[2];
      auto result = engine_.start_sharing(port, password);
      if(!result.ok()) {
        print_error(result.error);
        return;
      }
      print_session(*result.value);
      if(auto firewall = engine_.server()->last_firewall_status(); firewall && firewall->may_be_blocked) {
        std::cout << "Warning: the firewall may block incoming connections on port "
                  << result.value->port << ".\n";
      }
    } else if(action == "stop") {
      if(auto error = engine_.stop_sharing()) {
        print_error(error);
        return;
      }
      std::cout << "Sharing stopped.\n";
    } else if(action == "status") {
      print_session(engine_.sharing_status());
    } else {
      std::cout << "Usage: share start [port] [password] | share stop | share status\n";
    }
  }

  void list_ips() {
    auto interfaces = list_local_interfaces();
    if(interfaces.empty()) {
      std::cout << "No network interfaces besides loopback.\n";
      return;
    }
    for(const auto& iface : interfaces) {
      std::cout << "  " << std::left << std::setw(12) << iface.name << iface.address << "\n";
    }
  }

  void show_firewall() {
    auto status = engine_.probe_firewall();
    if(!status) {
      std::cout << "Firewall status unavailable.\n";
      return;
    }
    std::cout << "Firewall " << (status->enabled ? "enabled" : "disabled")
              << ", sharing port " << (status->app_allowed ? "allowed" : "not allowed") << "\n";
    if(status->may_be_blocked) {
      std::cout << "Peers may be unable to connect; allow the sharing port in your firewall.\n";
    }
  }

  void list_servers() {
    auto connections = engine_.connections();
    if(connections.empty()) {
      std::cout << "No saved connections.\n";
      return;
    }
    auto active = engine_.active_selection();
    for(const auto& c : connections) {
      const bool is_active = active.remote_connection_id && *active.remote_connection_id == c.id;
      std::cout << (is_active ? "* " : "  ") << c.id << "  " << c.label()
                << " (" << c.endpoint() << ")"
                << "  " << to_string(engine_.display_status(c))
                << "  model: " << c.cached_model_name.value_or("?")
                << "  checked: " << format_time(c.last_checked_at_ms)
                << (c.password ? "  [password]" : "") << "\n";
    }
  }

  void handle_add(const std::string& args) {
    auto parts = split_args(args);
    if(parts.empty()) {
      std::cout << "Usage: add <host> [port] [password] [name]\n";
      return;
    }
    uint16_t port = kDefaultSharingPort;
    if(parts.size() > 1) {
      auto parsed = parse_port(parts[1]);
      if(!parsed) {
        std::cout << "Invalid port '" << parts[1] << "'.\n";
        return;
      }
      port = *parsed;
    }
    std::optional<std::string> password = parts.size() > 2 ? std::optional<std::string>(parts[2]) : std::nullopt;
    std::optional<std::string> name;
    if(parts.size() > 3) name = join_from(parts, 3);
    auto result = engine_.add_connection(parts[0], port, password, name);
    if(!result.ok()) {
      print_error(result.error);
      return;
    }
    std::cout << "Saved " << result.value->id << " (" << result.value->label() << "), status "
              << to_string(result.value->cached_status) << "\n";
  }

  void handle_update(const std::string& args) {
    auto parts = split_args(args);
    if(parts.size() < 2) {
      std::cout << "Usage: update <id> <host> [port] [password] [name]\n";
      return;
    }
    uint16_t port = kDefaultSharingPort;
    if(parts.size() > 2) {
      auto parsed = parse_port(parts[2]);
      if(!parsed) {
        std::cout << "Invalid port '" << parts[2] << "'.\n";
        return;
      }
      port = *parsed;
    }
    std::optional<std::string> password = parts.size() > 3 ? std::optional<std::string>(parts[3]) : std::nullopt;
    std::optional<std::string> name;
    if(parts.size() > 4) name = join_from(parts, 4);
    auto result = engine_.update_connection(parts[0], parts[1], port, password, name);
    if(!result.ok()) {
      print_error(result.error);
      return;
    }
    std::cout << "Updated " << result.value->id << " (" << result.value->label() << "), status "
              << to_string(result.value->cached_status) << "\n";
  }

  void handle_remove(const std::string& args) {
    if(args.empty()) {
      std::cout << "Usage: remove <id>\n";
      return;
    }
    if(auto error = engine_.remove_connection(args)) {
      print_error(error);
      return;
    }
    std::cout << "Removed " << args << "\n";
  }

  void handle_test(const std::string& args) {
    auto parts = split_args(args);
    if(parts.empty()) {
      std::cout << "Usage: test <id> | test <host> [port] [password]\n";
      return;
    }
    ShareResult<StatusResponse> result;
    if(parts.size() == 1 && engine_.registry()->get(parts[0])) {
      result = engine_.test_saved_connection(parts[0]);
    } else {
      uint16_t port = kDefaultSharingPort;
      if(parts.size() > 1) {
        auto parsed = parse_port(parts[1]);
        if(!parsed) {
          std::cout << "Invalid port '" << parts[1] << "'.\n";
          return;
        }
        port = *parsed;
      }
      std::optional<std::string> password = parts.size() > 2 ? std::optional<std::string>(parts[2]) : std::nullopt;
      result = engine_.test_connection(parts[0], port, password);
    }
    if(!result.ok()) {
      print_error(result.error);
      return;
    }
    const auto& status = *result.value;
    std::cout << "Online: '" << status.name << "' serving '" << status.model
              << "' (version " << status.version << ")";
    if(!status.machine_id.empty() && status.machine_id == engine_.client()->local_machine_id()) {
      std::cout << " [this machine]";
    }
    std::cout << "\n";
  }

  void handle_use(const std::string& args) {
    if(args.empty()) {
      auto active = engine_.active_selection();
      if(active.is_remote()) {
        std::cout << "Source: remote " << *active.remote_connection_id << "\n";
      } else {
        std::cout << "Source: local model '" << active.local_model << "'\n";
      }
      return;
    }
    if(args == "local") {
      engine_.use_local();
      std::cout << "Using the local model.\n";
      return;
    }
    if(auto error = engine_.use_remote(args)) {
      print_error(error);
      return;
    }
    std::cout << "Using " << args << " for transcription.\n";
  }

  void handle_model(const std::string& args) {
    if(args.empty()) {
      auto resolved = engine_.server()->resolve_model();
      std::cout << "Local model: " << resolved.value_or("<none downloaded>") << "\n";
      return;
    }
    if(auto error = engine_.select_model(args)) {
      print_error(error);
      return;
    }
    std::cout << "Local model set to '" << args << "'.\n";
  }

  void list_models() {
    auto models = engine_.local_models();
    if(models.empty()) {
      std::cout << "No models downloaded.\n";
      return;
    }
    auto current = engine_.server()->resolve_model();
    for(const auto& model : models) {
      std::cout << (current && *current == model ? "* " : "  ") << model << "\n";
    }
  }

  void handle_transcribe(const std::string& args) {
    auto parts = split_args(args);
    if(parts.empty()) {
      std::cout << "Usage: transcribe <file> [live|upload]\n";
      return;
    }
    auto source = TranscriptionContext::Source::Upload;
    if(parts.size() > 1) {
      if(parts[1] == "live") {
        source = TranscriptionContext::Source::LiveRecording;
      } else if(parts[1] != "upload") {
        std::cout << "Usage: transcribe <file> [live|upload]\n";
        return;
      }
    }
    auto result = engine_.transcribe_file(parts[0], source);
    if(!result.ok()) {
      print_error(result.error);
      return;
    }
    std::cout << "[" << result.value->source << ", " << result.value->model_used << ", "
              << result.value->duration_ms << " ms]\n" << result.value->text << "\n";
  }

  static std::string join_from(const std::vector<std::string>& parts, std::size_t first) {
    std::string out;
    for(std::size_t i = first; i < parts.size(); ++i) {
      if(!out.empty()) out += ' ';
      out += parts[i];
    }
    return out;
  }

  void handle_settings_command(const std::string& args) {
    auto settings = engine_.settings();
    std::lock_guard<std::mutex> lock(engine_.settings_mutex());

    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      auto keys = settings->keys();
      std::sort(keys.begin(), keys.end());
      for(const auto& key : keys) {
        std::cout << key << " = " << settings->value_as_string(key) << "\n";
      }
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        std::cout << "Usage: settings get <key>\n";
        return;
      }
      auto resolved = settings->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::cout << *resolved << " = " << settings->value_as_string(*resolved) << "\n";
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      trim(value);
      if(key.empty() || value.empty()) {
        std::cout << "Usage: settings set <key> <value>\n";
        return;
      }
      auto resolved = settings->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::string error;
      if(settings->set_from_string(*resolved, value, error)) {
        if(*resolved == "verbose") init(settings->get<bool>("verbose"));
        std::cout << *resolved << " = " << settings->value_as_string(*resolved) << "\n";
      } else {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
      }
      return;
    }

    if(action == "save") {
      if(settings->save()) {
        std::cout << "Saved settings to " << settings->settings_path() << "\n";
      } else {
        std::cout << "Failed to save settings.\n";
      }
      return;
    }

    if(action == "load") {
      if(settings->load()) {
        init(settings->get<bool>("verbose"));
        std::cout << "Loaded settings from " << settings->settings_path() << "\n";
      } else {
        std::cout << "Settings file not found; keeping current values.\n";
      }
      return;
    }

    std::cout << "Unknown settings command.\n";
  }
};
