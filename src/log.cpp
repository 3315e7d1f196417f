#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Indexed by LogChannel.
std::array<std::shared_ptr<spdlog::logger>, 4> g_sinks;
std::once_flag g_sinks_once;
std::atomic<bool> g_log_passthrough{true};

std::size_t index_of(LogChannel channel) {
  return static_cast<std::size_t>(channel);
}

std::shared_ptr<spdlog::logger> make_sink_logger(const char* name,
                                                 bool to_stderr,
                                                 const char* pattern,
                                                 spdlog::level::level_enum flush_level) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void ensure_sinks() {
  std::call_once(g_sinks_once, [](){
    g_sinks[index_of(LogChannel::Info)] =
      make_sink_logger("voiceshare.info", false, kTimestampPattern, spdlog::level::warn);
    g_sinks[index_of(LogChannel::Error)] =
      make_sink_logger("voiceshare.error", true, kTimestampPattern, spdlog::level::err);
    g_sinks[index_of(LogChannel::Print)] =
      make_sink_logger("voiceshare.print", false, "%v", spdlog::level::info);
    g_sinks[index_of(LogChannel::PrintErr)] =
      make_sink_logger("voiceshare.print_err", true, "%v", spdlog::level::err);
  });
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  ensure_sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks[index_of(LogChannel::Info)]->set_level(level);
  g_sinks[index_of(LogChannel::Error)]->set_level(spdlog::level::info);
  g_sinks[index_of(LogChannel::Print)]->set_level(spdlog::level::info);
  g_sinks[index_of(LogChannel::PrintErr)]->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_sinks[index_of(LogChannel::Info)]);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::notify_listeners(LogChannel channel,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  const std::string label = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, label, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::write_default(LogChannel channel,
                           spdlog::level::level_enum level,
                           const std::string& message) const {
  detail::emit_to_default(channel, name_, level, message);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& source,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_sinks();
  if(!log_passthrough()) return;

  auto& sink = g_sinks[index_of(channel)];
  if(!sink) return;
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(plain || source.empty()) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail
