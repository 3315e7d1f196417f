#include "connection_status.hpp"

const char* to_string(ConnectionStatus status) {
  switch(status) {
    case ConnectionStatus::Unknown: return "unknown";
    case ConnectionStatus::Online: return "online";
    case ConnectionStatus::Offline: return "offline";
    case ConnectionStatus::AuthFailed: return "auth_failed";
    case ConnectionStatus::SelfConnection: return "self_connection";
  }
  return "unknown";
}

std::optional<ConnectionStatus> connection_status_from_string(const std::string& text) {
  for(auto status : {ConnectionStatus::Unknown, ConnectionStatus::Online,
                     ConnectionStatus::Offline, ConnectionStatus::AuthFailed,
                     ConnectionStatus::SelfConnection}) {
    if(text == to_string(status)) return status;
  }
  return std::nullopt;
}

const char* to_string(ProbeOutcome::Kind kind) {
  switch(kind) {
    case ProbeOutcome::Kind::Success: return "success";
    case ProbeOutcome::Kind::AuthFailed: return "auth_failed";
    case ProbeOutcome::Kind::Unreachable: return "unreachable";
    case ProbeOutcome::Kind::Timeout: return "timeout";
    case ProbeOutcome::Kind::ServerError: return "server_error";
  }
  return "unreachable";
}

ConnectionStatus classify(ConnectionStatus prior, const ProbeOutcome& outcome) {
  if(outcome.kind == ProbeOutcome::Kind::Success) {
    return outcome.machine_matches ? ConnectionStatus::SelfConnection
                                   : ConnectionStatus::Online;
  }
  if(prior == ConnectionStatus::SelfConnection) return prior;

  switch(outcome.kind) {
    case ProbeOutcome::Kind::AuthFailed:
      return ConnectionStatus::AuthFailed;
    case ProbeOutcome::Kind::Unreachable:
    case ProbeOutcome::Kind::Timeout:
    case ProbeOutcome::Kind::ServerError:
      return ConnectionStatus::Offline;
    case ProbeOutcome::Kind::Success:
      break;
  }
  return ConnectionStatus::Unknown;
}

ConnectionStatus effective_status(ConnectionStatus cached,
                                  uint64_t last_checked_ms,
                                  uint64_t now_ms,
                                  std::chrono::milliseconds stale_after) {
  if(cached == ConnectionStatus::SelfConnection) return cached;
  if(last_checked_ms == 0) return ConnectionStatus::Unknown;
  if(now_ms > last_checked_ms &&
     now_ms - last_checked_ms > static_cast<uint64_t>(stale_after.count())) {
    return ConnectionStatus::Unknown;
  }
  return cached;
}
