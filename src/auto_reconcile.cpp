#include "auto_reconcile.hpp"

const char* to_string(AutoReconcile::Outcome outcome) {
  switch(outcome) {
    case AutoReconcile::Outcome::None: return "none";
    case AutoReconcile::Outcome::Restarted: return "restarted";
    case AutoReconcile::Outcome::StoppedForRemote: return "stopped_for_remote";
    case AutoReconcile::Outcome::Restored: return "restored";
    case AutoReconcile::Outcome::Failed: return "failed";
  }
  return "none";
}

AutoReconcile::AutoReconcile(std::shared_ptr<SharingServer> server,
                             std::shared_ptr<SelectionService> selection,
                             std::shared_ptr<Logger> logger)
  : server_(std::move(server)),
    selection_(std::move(selection)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("reconcile"))
{
  if(!server_ || !selection_) {
    throw std::runtime_error("AutoReconcile requires a sharing server and a selection service");
  }
}

AutoReconcile::~AutoReconcile() {
  stop();
}

void AutoReconcile::start(std::chrono::milliseconds poll_interval) {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if(thread_.joinable()) return;
    stopping_ = false;
  }
  listener_handle_ = selection_->add_listener([this](const ActiveSelection&){ notify(); });
  thread_ = std::thread([this, poll_interval]{ loop(poll_interval); });
}

void AutoReconcile::stop() {
  if(listener_handle_ != 0) {
    selection_->remove_listener(listener_handle_);
    listener_handle_ = 0;
  }
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stopping_ = true;
  }
  wake_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void AutoReconcile::notify() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_requested_ = true;
  }
  wake_cv_.notify_all();
}

void AutoReconcile::loop(std::chrono::milliseconds poll_interval) {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  while(!stopping_) {
    wake_cv_.wait_for(lock, poll_interval, [this]{ return stopping_ || wake_requested_; });
    if(stopping_) break;
    wake_requested_ = false;
    lock.unlock();
    try {
      reconcile_once();
    } catch(const std::exception& e) {
      log_error(logger_.get(), "Reconcile cycle threw: {}", e.what());
    }
    lock.lock();
  }
}

SharingConfig AutoReconcile::config_of(const SharingSession& session) {
  SharingConfig config;
  config.port = session.port;
  config.password = session.password;
  config.display_name = session.display_name;
  return config;
}

AutoReconcile::Outcome AutoReconcile::fail(const std::string& action, const ShareError& cause) {
  ShareError error(ShareErrc::RestartFailed, action + " failed: " + cause.describe());
  error.binding_results = cause.binding_results;
  log_error(logger_.get(), "{}; sharing stays stopped until started again", error.message);
  FailureCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = error;
    callback = on_failure_;
  }
  if(callback) callback(error);
  return Outcome::Failed;
}

AutoReconcile::Outcome AutoReconcile::reconcile_once() {
  std::lock_guard<std::mutex> serial(reconcile_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++cycles_;
  }

  const auto selection = selection_->get_active();
  const auto session = server_->status();
  Outcome outcome = Outcome::None;

  if(selection.is_remote()) {
    if(!session.enabled) return Outcome::None;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      remembered_ = config_of(session);
    }
    if(auto error = server_->stop()) return fail("Pausing sharing", error);
    log_info(logger_.get(), "Sharing paused while remote source {} is active", *selection.remote_connection_id);
    outcome = Outcome::StoppedForRemote;
  } else if(!session.enabled) {
    std::optional<SharingConfig> restore;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      restore.swap(remembered_);
    }
    if(!restore) return Outcome::None;
    auto started = server_->start(restore->port, restore->password, restore->display_name);
    if(!started.ok()) return fail("Restoring sharing", started.error);
    log_info(logger_.get(), "Sharing restored on port {} with model '{}'", started.value->port, started.value->model_name);
    outcome = Outcome::Restored;
  } else {
    const auto desired = server_->resolve_model();
    if(desired && *desired == session.model_name) return Outcome::None;

    log_info(logger_.get(), "Local model changed from '{}' to '{}', restarting sharing",
             session.model_name, desired.value_or("<none>"));
    const auto config = config_of(session);
    if(auto error = server_->stop()) return fail("Restarting sharing", error);
    auto started = server_->start(config.port, config.password, config.display_name);
    if(!started.ok()) return fail("Restarting sharing", started.error);
    outcome = Outcome::Restarted;
  }

  ChangeCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_.reset();
    callback = on_change_;
  }
  if(callback) callback(outcome, server_->status());
  return outcome;
}

void AutoReconcile::run_exclusive(const std::function<void()>& fn) {
  std::lock_guard<std::mutex> serial(reconcile_mutex_);
  fn();
}

void AutoReconcile::set_failure_callback(FailureCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  on_failure_ = std::move(callback);
}

void AutoReconcile::set_change_callback(ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  on_change_ = std::move(callback);
}

void AutoReconcile::remember(SharingConfig config) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  remembered_ = std::move(config);
}

std::optional<SharingConfig> AutoReconcile::remembered() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return remembered_;
}

void AutoReconcile::forget() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  remembered_.reset();
}

std::optional<ShareError> AutoReconcile::last_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

uint64_t AutoReconcile::cycles() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return cycles_;
}
