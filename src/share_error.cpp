#include "share_error.hpp"

const char* to_string(ShareErrc code) {
  switch(code) {
    case ShareErrc::None: return "none";
    case ShareErrc::BindFailed: return "bind_failed";
    case ShareErrc::AlreadyRunning: return "already_running";
    case ShareErrc::NoModelAvailable: return "no_model_available";
    case ShareErrc::Unauthorized: return "unauthorized";
    case ShareErrc::Unreachable: return "unreachable";
    case ShareErrc::Timeout: return "timeout";
    case ShareErrc::SelfConnectionDetected: return "self_connection";
    case ShareErrc::RestartFailed: return "restart_failed";
    case ShareErrc::NotFound: return "not_found";
    case ShareErrc::InvalidArgument: return "invalid_argument";
    case ShareErrc::ServerError: return "server_error";
    case ShareErrc::InvalidResponse: return "invalid_response";
    case ShareErrc::PersistFailed: return "persist_failed";
  }
  return "unknown";
}

std::string ShareError::describe() const {
  std::string out = to_string(code);
  if(!message.empty()) {
    out += ": ";
    out += message;
  }
  for(const auto& binding : binding_results) {
    if(binding.success) continue;
    out += "\n  " + binding.address + ": " + binding.error;
  }
  return out;
}
