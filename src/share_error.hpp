#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ShareErrc {
  None,
  BindFailed,             // no interface could be bound
  AlreadyRunning,
  NoModelAvailable,
  Unauthorized,
  Unreachable,            // refused, DNS failure, or no connection before the deadline
  Timeout,                // connected, but the response did not arrive in time
  SelfConnectionDetected,
  RestartFailed,
  NotFound,
  InvalidArgument,
  ServerError,
  InvalidResponse,
  PersistFailed
};

const char* to_string(ShareErrc code);

struct BindingResult {
  std::string address;
  bool success = false;
  std::string error;
};

struct ShareError {
  ShareErrc code = ShareErrc::None;
  std::string message;
  // Populated for BindFailed so every interface failure stays visible.
  std::vector<BindingResult> binding_results;

  ShareError() = default;
  ShareError(ShareErrc c, std::string msg)
    : code(c), message(std::move(msg)) {}

  explicit operator bool() const { return code != ShareErrc::None; }
  std::string describe() const;
};

template<typename T>
struct ShareResult {
  std::optional<T> value;
  ShareError error;

  static ShareResult success(T v) {
    ShareResult r;
    r.value = std::move(v);
    return r;
  }
  static ShareResult failure(ShareError e) {
    ShareResult r;
    r.error = std::move(e);
    return r;
  }
  static ShareResult failure(ShareErrc code, std::string message) {
    return failure(ShareError(code, std::move(message)));
  }

  bool ok() const { return value.has_value(); }
};
