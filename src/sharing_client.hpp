#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "connection_registry.hpp"
#include "connection_status.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "share_error.hpp"

struct TranscriptionContext {
  enum class Source { LiveRecording, Upload };

  Source source = Source::LiveRecording;
  double audio_duration_seconds = 0.0;
};

// Live recordings wait clamp(d, 30, 120) seconds; uploads wait d + 60.
std::chrono::seconds transcription_timeout(const TranscriptionContext& context);

struct RemoteTranscription {
  std::string text;
  std::string model_used;
  uint64_t duration_ms = 0;
};

ProbeOutcome::Kind probe_kind_of(const ShareError& error);

// Talks to remote sharing servers. Requests run on an owned worker pool; the
// blocking calls must not be made from inside one of this client's callbacks.
class SharingClient {
public:
  using StatusCallback = std::function<void(ShareResult<StatusResponse>)>;
  using TranscribeCallback = std::function<void(ShareResult<RemoteTranscription>)>;

  SharingClient(std::shared_ptr<ConnectionRegistry> registry,
                std::string local_machine_id,
                std::chrono::milliseconds status_timeout = std::chrono::seconds(10),
                std::shared_ptr<Logger> logger = nullptr,
                std::size_t request_threads = 8);
  ~SharingClient();

  SharingClient(const SharingClient&) = delete;
  SharingClient& operator=(const SharingClient&) = delete;

  std::shared_ptr<HttpExchange> async_test_connection(const std::string& host,
                                                      uint16_t port,
                                                      const std::optional<std::string>& password,
                                                      StatusCallback callback);
  ShareResult<StatusResponse> test_connection(const std::string& host,
                                              uint16_t port,
                                              const std::optional<std::string>& password);

  std::shared_ptr<HttpExchange> async_transcribe(const SavedConnection& connection,
                                                 std::vector<uint8_t> audio,
                                                 std::chrono::milliseconds timeout,
                                                 TranscribeCallback callback);
  ShareResult<RemoteTranscription> transcribe(const std::string& connection_id,
                                              std::vector<uint8_t> audio,
                                              const TranscriptionContext& context);
  ShareResult<RemoteTranscription> transcribe(const std::string& connection_id,
                                              std::vector<uint8_t> audio,
                                              std::chrono::milliseconds timeout);

  // Classifies a probe result against the prior cached status and records
  // it in the registry. Returns the new status.
  ConnectionStatus apply_probe(const std::string& connection_id,
                               const ShareResult<StatusResponse>& result);

  // Probe, classify and record. Never throws.
  ConnectionStatus check_status(const std::string& connection_id);

  std::shared_ptr<ConnectionRegistry> registry() const { return registry_; }
  const std::string& local_machine_id() const { return local_machine_id_; }
  std::chrono::milliseconds status_timeout() const { return status_timeout_; }

private:
  std::shared_ptr<ConnectionRegistry> registry_;
  std::string local_machine_id_;
  std::chrono::milliseconds status_timeout_;
  std::shared_ptr<Logger> logger_;

  asio::thread_pool pool_;
};
