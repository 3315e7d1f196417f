#include "health_monitor.hpp"

HealthMonitor::HealthMonitor(std::shared_ptr<SharingClient> client,
                             std::chrono::seconds interval,
                             std::shared_ptr<Logger> logger)
  : state_(std::make_shared<State>()),
    interval_(interval),
    timer_(io_)
{
  if(!client) throw std::runtime_error("HealthMonitor requires a sharing client");
  state_->client = std::move(client);
  state_->logger = logger ? std::move(logger) : std::make_shared<Logger>("health");
}

HealthMonitor::~HealthMonitor() {
  stop();
}

void HealthMonitor::start() {
  if(running_) return;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stopped = false;
  }
  running_ = true;
  io_.restart();
  schedule_tick();
  thread_ = std::thread([this]{ io_.run(); });
  refresh_all();
}

void HealthMonitor::stop() {
  std::map<std::string, Pending> pending;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stopped = true;
    pending.swap(state_->pending);
  }
  for(auto& entry : pending) {
    if(entry.second.exchange) entry.second.exchange->cancel();
  }
  if(!running_) return;
  running_ = false;
  asio::post(io_, [this]{ timer_.cancel(); });
  if(thread_.joinable()) thread_.join();
}

void HealthMonitor::schedule_tick() {
  if(interval_.count() <= 0) return;
  timer_.expires_after(interval_);
  timer_.async_wait([this](const std::error_code& ec){
    if(ec) return;
    refresh_all();
    schedule_tick();
  });
}

void HealthMonitor::set_status_listener(StatusListener listener) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->listener = std::move(listener);
}

void HealthMonitor::refresh_all() {
  for(const auto& connection : state_->client->registry()->list()) {
    check_now(connection.id);
  }
}

void HealthMonitor::on_focus_regained() {
  log_debug(state_->logger.get(), "Focus regained, refreshing saved connections");
  refresh_all();
}

void HealthMonitor::check_now(const std::string& connection_id) {
  auto connection = state_->client->registry()->get(connection_id);
  if(!connection) return;

  uint64_t generation = 0;
  std::shared_ptr<HttpExchange> superseded;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if(state_->stopped) return;
    auto& slot = state_->pending[connection_id];
    if(slot.exchange) {
      superseded = slot.exchange;
      ++state_->superseded;
    }
    slot.generation = ++state_->next_generation;
    slot.exchange.reset();
    generation = slot.generation;
  }
  if(superseded) {
    log_debug(state_->logger.get(), "Superseding in-flight probe of {}", connection->label());
    superseded->cancel();
  }

  std::weak_ptr<State> weak = state_;
  auto exchange = state_->client->async_test_connection(connection->host, connection->port, connection->password,
    [weak, connection_id, generation](ShareResult<StatusResponse> result){
      if(auto state = weak.lock()) on_probe_result(state, connection_id, generation, result);
    });

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->pending.find(connection_id);
    if(it != state_->pending.end() && it->second.generation == generation) {
      it->second.exchange = std::move(exchange);
      return;
    }
  }
  // A newer probe took the slot, or stop() cleared it, before this one was stored.
  if(exchange) exchange->cancel();
}

void HealthMonitor::on_probe_result(const std::shared_ptr<State>& state,
                                    const std::string& connection_id,
                                    uint64_t generation,
                                    const ShareResult<StatusResponse>& result) {
  StatusListener listener;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    auto it = state->pending.find(connection_id);
    if(it == state->pending.end() || it->second.generation != generation) return;
    state->pending.erase(it);
    listener = state->listener;
  }

  ConnectionStatus status = ConnectionStatus::Unknown;
  try {
    status = state->client->apply_probe(connection_id, result);
  } catch(const std::exception& e) {
    log_error(state->logger.get(), "Recording probe of {} failed: {}", connection_id, e.what());
    return;
  }
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    ++state->completed;
  }
  if(listener) listener(connection_id, status);
}

std::size_t HealthMonitor::in_flight() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->pending.size();
}

uint64_t HealthMonitor::completed_checks() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->completed;
}

uint64_t HealthMonitor::superseded_checks() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->superseded;
}
