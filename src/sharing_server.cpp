#include "sharing_server.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>

namespace {

void reply_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

const char* error_name_for(int status) {
  switch(status) {
    case 400: return "bad_request";
    case 404: return "not_found";
    case 405: return "method_not_allowed";
    case 408: return "request_timeout";
    case 413: return "payload_too_large";
    case 414: return "uri_too_long";
    case 415: return "unsupported_media_type";
    default: return "error";
  }
}

} // namespace

SharingServer::SharingServer(ServerDependencies deps, std::shared_ptr<Logger> logger)
  : deps_(std::move(deps)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sharing-server"))
{
  if(!deps_.engine || !deps_.inventory || !deps_.selection) {
    throw std::runtime_error("SharingServer requires an engine, a model inventory and a selection service");
  }
  if(!deps_.gate) deps_.gate = std::make_shared<InferenceGate>();
  if(!deps_.interfaces) deps_.interfaces = list_local_interfaces;
}

SharingServer::~SharingServer() {
  stop();
}

std::optional<std::string> SharingServer::resolve_model() const {
  auto selected = deps_.selection->get_active().local_model;
  if(!selected.empty()) {
    if(deps_.inventory->has_model(selected)) return selected;
    return std::nullopt;
  }
  auto models = deps_.inventory->downloaded_models();
  if(models.empty()) return std::nullopt;
  return models.front();
}

std::optional<FirewallStatus> SharingServer::last_firewall_status() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return firewall_status_;
}

SharingSession SharingServer::status() const {
  SharingSession s;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    s = session_;
  }
  if(s.enabled) {
    s.active_connection_count = deps_.gate->active();
    s.queued_request_count = deps_.gate->waiting();
  }
  return s;
}

SharingSession SharingServer::snapshot() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_;
}

bool SharingServer::authorized(const std::optional<std::string>& password, const httplib::Request& request) {
  if(!password || password->empty()) return true;
  if(!request.has_header(kAuthHeader)) return false;
  const std::string provided = request.get_header_value(kAuthHeader);
  if(provided.size() != password->size()) return false;
  return CRYPTO_memcmp(provided.data(), password->data(), password->size()) == 0;
}

std::unique_ptr<httplib::Server> SharingServer::make_server() {
  auto server = std::make_unique<httplib::Server>();
  const std::size_t threads = std::max<std::size_t>(1, deps_.inference_threads) + 2;
  server->new_task_queue = [threads]{ return new httplib::ThreadPool(threads); };
  server->set_payload_max_length(kMaxBodyBytes);
  server->set_read_timeout(std::chrono::seconds(30));
  server->set_keep_alive_max_count(1);

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if(!res.body.empty()) return;
    reply_json(res, res.status, make_error_response(error_name_for(res.status)));
  });
  server->set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "internal error";
    try {
      if(ep) std::rethrow_exception(ep);
    } catch(const std::exception& e) {
      message = e.what();
    }
    log_error(logger_.get(), "Request {} {} from {} failed: {}", req.method, req.path, req.remote_addr, message);
    reply_json(res, 500, make_error_response(message));
  });

  auto not_allowed = [](const httplib::Request&, httplib::Response& res) {
    reply_json(res, 405, make_error_response("method_not_allowed"));
  };
  server->Get(kStatusPath, [this](const httplib::Request& req, httplib::Response& res) {
    handle_status(req, res);
  });
  server->Post(kStatusPath, not_allowed);
  server->Put(kStatusPath, not_allowed);
  server->Delete(kStatusPath, not_allowed);
  server->Patch(kStatusPath, not_allowed);

  server->Post(kTranscribePath, [this](const httplib::Request& req, httplib::Response& res) {
    handle_transcribe(req, res);
  });
  server->Get(kTranscribePath, not_allowed);
  server->Put(kTranscribePath, not_allowed);
  server->Delete(kTranscribePath, not_allowed);
  server->Patch(kTranscribePath, not_allowed);
  return server;
}

ShareResult<SharingSession> SharingServer::start(uint16_t port,
                                                 std::optional<std::string> password,
                                                 std::optional<std::string> display_name) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if(session_.enabled) {
      return ShareResult<SharingSession>::failure(ShareErrc::AlreadyRunning,
        "sharing is already running on port " + std::to_string(session_.port));
    }
  }

  auto model = resolve_model();
  if(!model) {
    const auto selected = deps_.selection->get_active().local_model;
    return ShareResult<SharingSession>::failure(ShareErrc::NoModelAvailable,
      selected.empty() ? std::string("no downloaded model is available to share")
                       : "model '" + selected + "' not found or not downloaded");
  }

  if(password && password->empty()) password.reset();
  std::string name = display_name.value_or(std::string());
  if(name.empty()) name = local_host_name();

  BindingResolver resolver(deps_.interfaces, logger_);
  auto bound = resolver.resolve_and_bind([this]{ return make_server(); }, port);
  auto results = BindingResolver::results_of(bound);

  uint16_t bound_port = port;
  std::vector<Listener> listeners;
  for(auto& entry : bound) {
    if(!entry.server) continue;
    if(listeners.empty()) bound_port = entry.port;
    Listener listener;
    listener.address = entry.result.address;
    listener.server = std::move(entry.server);
    listeners.push_back(std::move(listener));
  }

  if(listeners.empty()) {
    ShareError error(ShareErrc::BindFailed,
      "could not bind port " + std::to_string(port) + " on any interface");
    error.binding_results = std::move(results);
    log_error(logger_.get(), "{}", error.describe());
    return ShareResult<SharingSession>::failure(std::move(error));
  }

  SharingSession session;
  session.enabled = true;
  session.port = bound_port;
  session.password = password;
  session.display_name = name;
  session.model_name = *model;
  session.binding_results = std::move(results);

  std::optional<FirewallStatus> firewall;
  if(deps_.firewall) {
    firewall = deps_.firewall->probe(bound_port);
    if(firewall->may_be_blocked) {
      log_warn(logger_.get(), "Firewall is enabled and port {} is not allowed; peers may be unable to connect",
               bound_port);
    }
  }

  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_ = session;
    firewall_status_ = firewall;
  }

  listeners_ = std::move(listeners);
  for(auto& listener : listeners_) {
    httplib::Server* server = listener.server.get();
    listener.thread = std::thread([server, address = listener.address, logger = logger_]{
      if(!server->listen_after_bind()) {
        log_error(logger.get(), "Listener on {} stopped unexpectedly", address);
      }
    });
  }
  for(auto& listener : listeners_) listener.server->wait_until_ready();

  log_info(logger_.get(), "Sharing STARTED on port {} as '{}' with model '{}' ({})",
           session.port, session.display_name, session.model_name,
           session.password ? "password required" : "no password");
  return ShareResult<SharingSession>::success(std::move(session));
}

ShareError SharingServer::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  uint16_t port = 0;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if(!session_.enabled) return {};
    port = session_.port;
  }

  // Each listener returns once its in-flight requests have been answered.
  for(auto& listener : listeners_) listener.server->stop();
  for(auto& listener : listeners_) {
    if(listener.thread.joinable()) listener.thread.join();
  }
  listeners_.clear();

  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_ = SharingSession{};
    firewall_status_.reset();
  }
  log_info(logger_.get(), "Sharing STOPPED (was on port {})", port);
  return {};
}

void SharingServer::handle_status(const httplib::Request& req, httplib::Response& res) {
  const auto session = snapshot();
  if(!authorized(session.password, req)) {
    log_warn(logger_.get(), "Status request from {} REJECTED: authentication failed", req.remote_addr);
    reply_json(res, 401, make_error_response("unauthorized"));
    return;
  }
  log_debug(logger_.get(), "Status request from {}", req.remote_addr);
  StatusResponse status;
  status.version = protocol_version();
  status.model = session.model_name;
  status.name = session.display_name;
  status.machine_id = deps_.machine_id;
  reply_json(res, 200, make_status_response(status));
}

void SharingServer::handle_transcribe(const httplib::Request& req, httplib::Response& res) {
  const auto session = snapshot();
  if(!authorized(session.password, req)) {
    log_warn(logger_.get(), "Transcription request from {} REJECTED: authentication failed", req.remote_addr);
    reply_json(res, 401, make_error_response("unauthorized"));
    return;
  }
  const std::string content_type = req.get_header_value("Content-Type");
  if(content_type.compare(0, 6, "audio/") != 0) {
    reply_json(res, 415, make_error_response("unsupported_media_type"));
    return;
  }
  if(req.body.empty()) {
    reply_json(res, 400, make_error_response("empty_audio"));
    return;
  }

  log_info(logger_.get(), "Transcription request from {} ({} bytes), queued behind {} waiting",
           req.remote_addr, req.body.size(), deps_.gate->waiting());
  const std::vector<uint8_t> audio(req.body.begin(), req.body.end());
  try {
    std::string text;
    std::chrono::steady_clock::time_point started;
    {
      InferenceGate::Lease lease(*deps_.gate);
      started = std::chrono::steady_clock::now();
      text = deps_.engine->transcribe(audio, session.model_name);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count();
    TranscribeResponse body;
    body.text = std::move(text);
    body.duration_ms = static_cast<uint64_t>(elapsed);
    body.model = session.model_name;
    log_info(logger_.get(), "Transcription for {} completed in {} ms", req.remote_addr, elapsed);
    reply_json(res, 200, make_transcribe_response(body));
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Transcription for {} failed: {}", req.remote_addr, e.what());
    reply_json(res, 500, make_error_response(e.what()));
  }
}
