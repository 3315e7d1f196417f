#include "sharing_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "ShareCLI.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

// Raw PCM estimate for payloads without a readable WAV header: 16 kHz mono 16-bit.
constexpr double kFallbackBytesPerSecond = 16000.0 * 2.0;

std::optional<std::string> non_empty(std::optional<std::string> value) {
  if(value && value->empty()) return std::nullopt;
  return value;
}

} // namespace

SharingEngine::SharingEngine(std::shared_ptr<SettingsManager> settings, Options options, Collaborators collaborators)
  : options_(std::move(options)),
    collaborators_(std::move(collaborators)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("voiceshare")),
    gate_(std::make_shared<InferenceGate>()) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  if(options_.reconcile_poll.count() <= 0) {
    options_.reconcile_poll = std::chrono::seconds(2);
  }
}

SharingEngine::~SharingEngine() {
  stop();
}

void SharingEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root / ".config", ec);
}

void SharingEngine::build_collaborators() {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  if(!collaborators_.inventory) {
    std::filesystem::path model_dir = settings_->get<std::string>("model_dir");
    if(model_dir.is_relative()) model_dir = options_.workspace_root / model_dir;
    collaborators_.inventory = std::make_shared<DirectoryModelInventory>(model_dir);
  }
  if(!collaborators_.engine) {
    collaborators_.engine = std::make_shared<CommandTranscriptionEngine>(
      settings_->get<std::string>("engine_command"),
      collaborators_.inventory,
      std::make_shared<Logger>("engine"));
  }
  if(!collaborators_.firewall) {
    collaborators_.firewall = std::make_shared<SystemFirewallProbe>();
  }
  if(collaborators_.machine_id.empty()) {
    collaborators_.machine_id = local_machine_id();
  }
}

void SharingEngine::start() {
  if(started_) return;
  started_ = true;
  stop_requested_ = false;

  ensure_workspace();
  if(!settings_->has_settings_path()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }
  init(settings_->get<bool>("verbose"));
  build_collaborators();

  int health_interval = 30;
  int status_timeout = 10;
  int stale_after = 90;
  int threads = 4;
  ActiveSelection initial;
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    health_interval = settings_->get<int>("health_interval_s");
    status_timeout = settings_->get<int>("status_timeout_s");
    stale_after = settings_->get<int>("stale_after_s");
    threads = settings_->get<int>("inference_threads");
    initial.local_model = settings_->get<std::string>("current_model");
    auto remote = settings_->get<std::string>("active_remote_id");
    if(!remote.empty()) initial.remote_connection_id = remote;
  }
  if(status_timeout <= 0 || threads <= 0 || stale_after <= 0) {
    logger_->error("status_timeout_s, stale_after_s and inference_threads must be positive");
    throw std::runtime_error("Invalid sharing settings");
  }

  registry_ = std::make_shared<ConnectionRegistry>(options_.workspace_root / ".config" / "connections.json");
  std::string error;
  if(!registry_->load(error)) {
    logger_->warn("Saved connections unavailable: {}", error);
  }
  if(initial.remote_connection_id) {
    auto saved = registry_->get(*initial.remote_connection_id);
    if(!saved || saved->cached_status == ConnectionStatus::SelfConnection) {
      logger_->warn("Active remote {} is not usable, falling back to local", *initial.remote_connection_id);
      initial.remote_connection_id.reset();
    }
  }

  selection_ = std::make_shared<LocalSelectionService>(initial,
    [this](const ActiveSelection& s){ persist_selection(s); });

  ServerDependencies deps;
  deps.engine = collaborators_.engine;
  deps.inventory = collaborators_.inventory;
  deps.selection = selection_;
  deps.gate = gate_;
  deps.firewall = collaborators_.firewall;
  deps.interfaces = options_.interfaces;
  deps.machine_id = collaborators_.machine_id;
  deps.inference_threads = static_cast<std::size_t>(threads);
  server_ = std::make_shared<SharingServer>(deps);

  client_ = std::make_shared<SharingClient>(registry_, collaborators_.machine_id,
                                            std::chrono::seconds(status_timeout));

  health_ = std::make_shared<HealthMonitor>(client_, std::chrono::seconds(std::max(0, health_interval)));
  health_->set_status_listener([this](const std::string& id, ConnectionStatus status){
    on_status_change(id, status);
  });

  reconcile_ = std::make_shared<AutoReconcile>(server_, selection_);
  reconcile_->set_failure_callback([this](const ShareError& e){
    print_err(logger_.get(), "Sharing stopped: {}", e.message);
    persist_sharing(false, nullptr);
  });
  reconcile_->start(options_.reconcile_poll);

  if(options_.auto_start_sharing) auto_start_sharing();
  if(options_.start_health_monitor) health_->start();

  cli_ = std::make_unique<ShareCLI>(*this);
  if(options_.start_cli_thread) cli_->start();
}

void SharingEngine::run() {
  if(!started_) start();
  std::unique_lock<std::mutex> lock(run_mutex_);
  run_cv_.wait(lock, [this]{ return stop_requested_; });
}

void SharingEngine::request_stop() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    stop_requested_ = true;
  }
  run_cv_.notify_all();
}

void SharingEngine::stop() {
  if(!started_) return;
  started_ = false;
  request_stop();

  if(cli_) cli_->stop();
  if(reconcile_) reconcile_->stop();
  if(health_) health_->stop();
  if(server_) {
    if(auto error = server_->stop()) logger_->error("Stopping sharing: {}", error.describe());
  }
  cli_.reset();
}

void SharingEngine::execute_command(const std::string& line) {
  if(cli_) cli_->execute_command(line);
}

void SharingEngine::auto_start_sharing() {
  bool enabled = false;
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    enabled = settings_->get<bool>("sharing_enabled");
  }
  if(!enabled) return;

  if(selection_->get_active().is_remote()) {
    logger_->info("Sharing was enabled but a remote source is active; it resumes when returning to local");
    SharingConfig config;
    std::lock_guard<std::mutex> lock(settings_mutex_);
    config.port = static_cast<uint16_t>(settings_->get<int>("sharing_port"));
    config.password = non_empty(settings_->get<std::string>("sharing_password"));
    config.display_name = non_empty(settings_->get<std::string>("display_name"));
    reconcile_->remember(config);
    return;
  }
  auto result = start_sharing();
  if(!result.ok()) {
    logger_->error("Sharing could not be restored at startup: {}", result.error.describe());
  }
}

ShareResult<SharingSession> SharingEngine::start_sharing(std::optional<uint16_t> port,
                                                         std::optional<std::string> password,
                                                         std::optional<std::string> display_name) {
  if(!server_) return ShareResult<SharingSession>::failure(ShareErrc::InvalidArgument, "engine not started");
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    if(!port) {
      const int configured = settings_->get<int>("sharing_port");
      if(configured < 0 || configured > 65535) {
        return ShareResult<SharingSession>::failure(ShareErrc::InvalidArgument,
          "invalid sharing_port " + std::to_string(configured));
      }
      port = static_cast<uint16_t>(configured);
    }
    if(!password) password = settings_->get<std::string>("sharing_password");
    if(!display_name) display_name = settings_->get<std::string>("display_name");
  }

  ShareResult<SharingSession> result;
  reconcile_->run_exclusive([&]{
    result = server_->start(*port, non_empty(password), non_empty(display_name));
    if(result.ok()) reconcile_->forget();
  });
  if(!result.ok()) return result;

  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    std::string error;
    settings_->set_from_json("sharing_port", static_cast<int>(*port), error);
    settings_->set_from_json("sharing_password", password.value_or(""), error);
  }
  persist_sharing(true, &*result.value);
  return result;
}

ShareError SharingEngine::stop_sharing() {
  if(!server_) return {};
  ShareError error;
  reconcile_->run_exclusive([&]{
    reconcile_->forget();
    error = server_->stop();
  });
  if(error) return error;
  persist_sharing(false, nullptr);
  return {};
}

SharingSession SharingEngine::sharing_status() const {
  if(!server_) return {};
  return server_->status();
}

std::optional<FirewallStatus> SharingEngine::probe_firewall() const {
  if(!collaborators_.firewall) return std::nullopt;
  uint16_t port = kDefaultSharingPort;
  auto session = sharing_status();
  if(session.enabled) {
    port = session.port;
  } else {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    port = static_cast<uint16_t>(settings_->get<int>("sharing_port"));
  }
  return collaborators_.firewall->probe(port);
}

void SharingEngine::persist_sharing(bool enabled, const SharingSession* session) {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  std::string error;
  settings_->set_from_json("sharing_enabled", enabled, error);
  if(session && settings_->get<int>("sharing_port") != 0) {
    settings_->set_from_json("sharing_port", static_cast<int>(session->port), error);
  }
  if(!settings_->save()) {
    logger_->warn("Sharing state not persisted to {}", settings_->settings_path().string());
  }
}

void SharingEngine::persist_selection(const ActiveSelection& selection) {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  std::string error;
  settings_->set_from_json("current_model", selection.local_model, error);
  settings_->set_from_json("active_remote_id", selection.remote_connection_id.value_or(""), error);
  if(!settings_->save()) {
    logger_->warn("Selection not persisted to {}", settings_->settings_path().string());
  }
}

void SharingEngine::on_status_change(const std::string& id, ConnectionStatus status) {
  if(status != ConnectionStatus::SelfConnection || !selection_) return;
  auto active = selection_->get_active();
  if(active.remote_connection_id && *active.remote_connection_id == id) {
    logger_->warn("Connection {} points at this machine; switching back to the local model", id);
    selection_->set_active_remote(std::nullopt);
  }
}

ShareResult<SavedConnection> SharingEngine::add_connection(const std::string& host,
                                                           uint16_t port,
                                                           std::optional<std::string> password,
                                                           std::optional<std::string> display_name) {
  if(!registry_) return ShareResult<SavedConnection>::failure(ShareErrc::InvalidArgument, "engine not started");
  const std::string clean_host = trim_copy(host);
  if(clean_host.empty() || port == 0) {
    return ShareResult<SavedConnection>::failure(ShareErrc::InvalidArgument, "host and port are required");
  }

  auto probe = client_->test_connection(clean_host, port, non_empty(password));
  // Re-adding a known endpoint classifies against what is already recorded.
  ConnectionStatus prior = ConnectionStatus::Unknown;
  if(auto known = registry_->find_by_endpoint(clean_host, port)) prior = known->cached_status;

  SavedConnection candidate;
  candidate.host = clean_host;
  candidate.port = port;
  candidate.password = non_empty(password);
  candidate.display_name = non_empty(display_name);
  candidate.last_checked_at_ms = unix_time_ms();
  if(probe.ok()) {
    if(!candidate.display_name && !probe.value->name.empty()) candidate.display_name = probe.value->name;
    candidate.cached_model_name = probe.value->model;
    candidate.cached_status = classify(prior,
      ProbeOutcome::success(probe.value->machine_id == client_->local_machine_id()));
  } else {
    candidate.cached_status = classify(prior, ProbeOutcome::failure(probe_kind_of(probe.error)));
    logger_->warn("Saving {}:{} although the probe failed: {}", clean_host, port, probe.error.describe());
  }
  if(!candidate.display_name) candidate.display_name = candidate.endpoint();

  auto saved = registry_->upsert(candidate);
  if(saved.cached_status == ConnectionStatus::SelfConnection) {
    logger_->warn("{} is this machine's own server; it cannot be used as a source", saved.label());
  }
  return ShareResult<SavedConnection>::success(saved);
}

ShareResult<SavedConnection> SharingEngine::update_connection(const std::string& id,
                                                              const std::string& host,
                                                              uint16_t port,
                                                              std::optional<std::string> password,
                                                              std::optional<std::string> display_name) {
  if(!registry_) return ShareResult<SavedConnection>::failure(ShareErrc::InvalidArgument, "engine not started");
  auto existing = registry_->get(id);
  if(!existing) return ShareResult<SavedConnection>::failure(ShareErrc::NotFound, "no saved connection " + id);
  const std::string clean_host = trim_copy(host);
  if(clean_host.empty() || port == 0) {
    return ShareResult<SavedConnection>::failure(ShareErrc::InvalidArgument, "host and port are required");
  }

  auto probe = client_->test_connection(clean_host, port, non_empty(password));
  // The recorded status carries over only while the endpoint stays the same.
  ConnectionStatus prior = ConnectionStatus::Unknown;
  auto same_endpoint = registry_->find_by_endpoint(clean_host, port);
  if(same_endpoint && same_endpoint->id == id) prior = existing->cached_status;

  SavedConnection changes = *existing;
  changes.host = clean_host;
  changes.port = port;
  changes.password = non_empty(password);
  changes.display_name = non_empty(display_name);
  changes.last_checked_at_ms = unix_time_ms();
  if(probe.ok()) {
    if(!changes.display_name && !probe.value->name.empty()) changes.display_name = probe.value->name;
    changes.cached_model_name = probe.value->model;
    changes.cached_status = classify(prior,
      ProbeOutcome::success(probe.value->machine_id == client_->local_machine_id()));
  } else {
    changes.cached_status = classify(prior, ProbeOutcome::failure(probe_kind_of(probe.error)));
  }
  if(!changes.display_name) changes.display_name = changes.endpoint();

  auto updated = registry_->update(id, changes);
  if(updated.ok()) on_status_change(id, updated.value->cached_status);
  return updated;
}

ShareError SharingEngine::remove_connection(const std::string& id) {
  if(!registry_) return ShareError(ShareErrc::InvalidArgument, "engine not started");
  auto active = selection_->get_active();
  if(!registry_->remove(id)) return ShareError(ShareErrc::NotFound, "no saved connection " + id);
  if(active.remote_connection_id && *active.remote_connection_id == id) {
    selection_->set_active_remote(std::nullopt);
  }
  return {};
}

ShareResult<StatusResponse> SharingEngine::test_saved_connection(const std::string& id) {
  if(!registry_) return ShareResult<StatusResponse>::failure(ShareErrc::InvalidArgument, "engine not started");
  auto connection = registry_->get(id);
  if(!connection) return ShareResult<StatusResponse>::failure(ShareErrc::NotFound, "no saved connection " + id);
  auto result = client_->test_connection(connection->host, connection->port, connection->password);
  on_status_change(id, client_->apply_probe(id, result));
  return result;
}

ShareResult<StatusResponse> SharingEngine::test_connection(const std::string& host,
                                                           uint16_t port,
                                                           const std::optional<std::string>& password) {
  if(!client_) return ShareResult<StatusResponse>::failure(ShareErrc::InvalidArgument, "engine not started");
  return client_->test_connection(trim_copy(host), port, non_empty(password));
}

std::vector<SavedConnection> SharingEngine::connections() const {
  if(!registry_) return {};
  return registry_->list();
}

void SharingEngine::refresh_connections() {
  if(health_) health_->refresh_all();
}

ConnectionStatus SharingEngine::display_status(const SavedConnection& connection) const {
  int stale_after = 90;
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    stale_after = settings_->get<int>("stale_after_s");
  }
  return effective_status(connection.cached_status, connection.last_checked_at_ms, unix_time_ms(),
                          std::chrono::seconds(stale_after));
}

ShareError SharingEngine::use_remote(const std::string& id) {
  if(!registry_) return ShareError(ShareErrc::InvalidArgument, "engine not started");
  auto connection = registry_->get(id);
  if(!connection) return ShareError(ShareErrc::NotFound, "no saved connection " + id);
  if(!is_selectable(connection->cached_status)) {
    return ShareError(ShareErrc::SelfConnectionDetected,
                      connection->label() + " is this machine's own server");
  }
  selection_->set_active_remote(id);
  logger_->info("Transcribing through {}", connection->label());
  return {};
}

void SharingEngine::use_local() {
  if(selection_) selection_->set_active_remote(std::nullopt);
}

ShareError SharingEngine::select_model(const std::string& name) {
  if(!selection_) return ShareError(ShareErrc::InvalidArgument, "engine not started");
  if(!collaborators_.inventory->has_model(name)) {
    return ShareError(ShareErrc::NotFound, "model '" + name + "' is not downloaded");
  }
  selection_->set_local_model(name);
  return {};
}

ActiveSelection SharingEngine::active_selection() const {
  if(!selection_) return {};
  return selection_->get_active();
}

std::vector<std::string> SharingEngine::local_models() const {
  if(!collaborators_.inventory) return {};
  return collaborators_.inventory->downloaded_models();
}

ShareResult<TranscriptionOutcome> SharingEngine::transcribe_locally(const std::vector<uint8_t>& audio) {
  auto model = server_->resolve_model();
  if(!model) {
    return ShareResult<TranscriptionOutcome>::failure(ShareErrc::NoModelAvailable, "no downloaded model");
  }
  try {
    InferenceGate::Lease lease(*gate_);
    const auto started = std::chrono::steady_clock::now();
    TranscriptionOutcome outcome;
    outcome.text = collaborators_.engine->transcribe(audio, *model);
    outcome.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count());
    outcome.model_used = *model;
    outcome.source = "local";
    return ShareResult<TranscriptionOutcome>::success(std::move(outcome));
  } catch(const std::exception& e) {
    return ShareResult<TranscriptionOutcome>::failure(ShareErrc::ServerError, e.what());
  }
}

ShareResult<TranscriptionOutcome> SharingEngine::transcribe(std::vector<uint8_t> audio,
                                                            const TranscriptionContext& context) {
  if(!selection_) return ShareResult<TranscriptionOutcome>::failure(ShareErrc::InvalidArgument, "engine not started");
  if(audio.empty()) return ShareResult<TranscriptionOutcome>::failure(ShareErrc::InvalidArgument, "no audio");

  auto active = selection_->get_active();
  if(!active.is_remote()) return transcribe_locally(audio);

  const auto id = *active.remote_connection_id;
  auto remote = client_->transcribe(id, std::move(audio), context);
  if(!remote.ok()) {
    if(remote.error.code == ShareErrc::SelfConnectionDetected) on_status_change(id, ConnectionStatus::SelfConnection);
    return ShareResult<TranscriptionOutcome>::failure(remote.error);
  }
  TranscriptionOutcome outcome;
  outcome.text = std::move(remote.value->text);
  outcome.model_used = std::move(remote.value->model_used);
  outcome.duration_ms = remote.value->duration_ms;
  outcome.remote = true;
  auto connection = registry_->get(id);
  outcome.source = connection ? connection->label() : id;
  return ShareResult<TranscriptionOutcome>::success(std::move(outcome));
}

ShareResult<TranscriptionOutcome> SharingEngine::transcribe_file(const std::filesystem::path& path,
                                                                 TranscriptionContext::Source source) {
  std::vector<uint8_t> audio;
  std::string error;
  if(!read_file_bytes(path, audio, error)) {
    return ShareResult<TranscriptionOutcome>::failure(ShareErrc::InvalidArgument, error);
  }
  TranscriptionContext context;
  context.source = source;
  context.audio_duration_seconds = wav_duration_seconds(audio)
    .value_or(static_cast<double>(audio.size()) / kFallbackBytesPerSecond);
  return transcribe(std::move(audio), context);
}

LogListenerHandle SharingEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void SharingEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) logger_->remove_listener(handle);
}
