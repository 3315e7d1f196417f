#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum class ConnectionStatus { Unknown, Online, Offline, AuthFailed, SelfConnection };

const char* to_string(ConnectionStatus status);
std::optional<ConnectionStatus> connection_status_from_string(const std::string& text);

// What one status probe observed.
struct ProbeOutcome {
  enum class Kind { Success, AuthFailed, Unreachable, Timeout, ServerError };

  Kind kind = Kind::Unreachable;
  // Only meaningful for Success: the responder reported our own machine id.
  bool machine_matches = false;

  static ProbeOutcome success(bool same_machine) { return {Kind::Success, same_machine}; }
  static ProbeOutcome failure(Kind kind) { return {kind, false}; }
};

const char* to_string(ProbeOutcome::Kind kind);

// Next status for a connection given its prior status and a fresh probe.
// SelfConnection survives failed probes; only a success from a different
// machine clears it.
ConnectionStatus classify(ConnectionStatus prior, const ProbeOutcome& outcome);

// Cached status as it should be read now. Anything older than `stale_after`
// reads as Unknown, except SelfConnection, which never expires.
ConnectionStatus effective_status(ConnectionStatus cached,
                                  uint64_t last_checked_ms,
                                  uint64_t now_ms,
                                  std::chrono::milliseconds stale_after);

inline bool is_selectable(ConnectionStatus status) {
  return status != ConnectionStatus::SelfConnection;
}
