#include "sharing_client.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <future>

namespace {

ShareError error_from_outcome(const HttpOutcome& outcome, const std::string& endpoint) {
  switch(outcome.kind) {
    case HttpOutcome::Kind::ConnectFailed:
      return ShareError(ShareErrc::Unreachable, endpoint + ": " + outcome.error);
    case HttpOutcome::Kind::Timeout:
      return ShareError(ShareErrc::Timeout, endpoint + ": " + outcome.error);
    case HttpOutcome::Kind::ProtocolError:
      return ShareError(ShareErrc::InvalidResponse, endpoint + ": " + outcome.error);
    case HttpOutcome::Kind::Response:
      break;
  }
  const int status = outcome.status;
  if(status == 401) {
    return ShareError(ShareErrc::Unauthorized, endpoint + " rejected the password");
  }
  std::string message = parse_error_message(outcome.body);
  if(message.empty()) message = "HTTP " + std::to_string(status);
  return ShareError(ShareErrc::ServerError,
                    endpoint + " answered " + std::to_string(status) + ": " + message);
}

HttpRequest make_request(const std::string& method,
                         const std::string& path,
                         const std::optional<std::string>& password) {
  HttpRequest request;
  request.method = method;
  request.path = path;
  request.headers.emplace("Accept", "application/json");
  if(password && !password->empty()) request.headers.emplace(kAuthHeader, *password);
  return request;
}

} // namespace

std::chrono::seconds transcription_timeout(const TranscriptionContext& context) {
  const double d = std::max(0.0, context.audio_duration_seconds);
  if(context.source == TranscriptionContext::Source::Upload) {
    return std::chrono::seconds(static_cast<int64_t>(std::ceil(d)) + 60);
  }
  return std::chrono::seconds(static_cast<int64_t>(std::ceil(std::clamp(d, 30.0, 120.0))));
}

ProbeOutcome::Kind probe_kind_of(const ShareError& error) {
  switch(error.code) {
    case ShareErrc::None: return ProbeOutcome::Kind::Success;
    case ShareErrc::Unauthorized: return ProbeOutcome::Kind::AuthFailed;
    case ShareErrc::Timeout: return ProbeOutcome::Kind::Timeout;
    case ShareErrc::ServerError:
    case ShareErrc::InvalidResponse: return ProbeOutcome::Kind::ServerError;
    default: return ProbeOutcome::Kind::Unreachable;
  }
}

SharingClient::SharingClient(std::shared_ptr<ConnectionRegistry> registry,
                             std::string local_machine_id,
                             std::chrono::milliseconds status_timeout,
                             std::shared_ptr<Logger> logger,
                             std::size_t request_threads)
  : registry_(std::move(registry)),
    local_machine_id_(std::move(local_machine_id)),
    status_timeout_(status_timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sharing-client")),
    pool_(std::max<std::size_t>(1, request_threads))
{
  if(!registry_) throw std::runtime_error("SharingClient requires a connection registry");
}

SharingClient::~SharingClient() {
  pool_.join();
}

std::shared_ptr<HttpExchange> SharingClient::async_test_connection(const std::string& host,
                                                                   uint16_t port,
                                                                   const std::optional<std::string>& password,
                                                                   StatusCallback callback) {
  const std::string endpoint = host + ":" + std::to_string(port);
  return HttpExchange::start(pool_, host, port, make_request("GET", kStatusPath, password), status_timeout_,
    [endpoint, callback = std::move(callback), logger = logger_](HttpOutcome outcome){
      ShareResult<StatusResponse> result;
      if(outcome.kind == HttpOutcome::Kind::Response && outcome.status == 200) {
        StatusResponse status;
        std::string error;
        if(parse_status_response(outcome.body, status, error)) {
          result = ShareResult<StatusResponse>::success(std::move(status));
        } else {
          result = ShareResult<StatusResponse>::failure(ShareErrc::InvalidResponse, endpoint + ": " + error);
        }
      } else {
        result = ShareResult<StatusResponse>::failure(error_from_outcome(outcome, endpoint));
      }
      if(!result.ok()) log_debug(logger.get(), "Status probe failed: {}", result.error.describe());
      if(callback) callback(std::move(result));
    });
}

ShareResult<StatusResponse> SharingClient::test_connection(const std::string& host,
                                                           uint16_t port,
                                                           const std::optional<std::string>& password) {
  auto promise = std::make_shared<std::promise<ShareResult<StatusResponse>>>();
  auto future = promise->get_future();
  async_test_connection(host, port, password, [promise](ShareResult<StatusResponse> result){
    promise->set_value(std::move(result));
  });
  return future.get();
}

std::shared_ptr<HttpExchange> SharingClient::async_transcribe(const SavedConnection& connection,
                                                              std::vector<uint8_t> audio,
                                                              std::chrono::milliseconds timeout,
                                                              TranscribeCallback callback) {
  HttpRequest request = make_request("POST", kTranscribePath, connection.password);
  request.headers.emplace("Content-Type", kAudioContentType);
  request.body.assign(audio.begin(), audio.end());

  const std::string endpoint = connection.endpoint();
  log_info(logger_.get(), "Sending {} bytes to {} (timeout {}s)", request.body.size(), connection.label(),
           std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
  return HttpExchange::start(pool_, connection.host, connection.port, std::move(request), timeout,
    [endpoint, callback = std::move(callback)](HttpOutcome outcome){
      ShareResult<RemoteTranscription> result;
      if(outcome.kind == HttpOutcome::Kind::Response && outcome.status == 200) {
        TranscribeResponse body;
        std::string error;
        if(parse_transcribe_response(outcome.body, body, error)) {
          RemoteTranscription t;
          t.text = std::move(body.text);
          t.model_used = std::move(body.model);
          t.duration_ms = body.duration_ms;
          result = ShareResult<RemoteTranscription>::success(std::move(t));
        } else {
          result = ShareResult<RemoteTranscription>::failure(ShareErrc::InvalidResponse, endpoint + ": " + error);
        }
      } else {
        result = ShareResult<RemoteTranscription>::failure(error_from_outcome(outcome, endpoint));
      }
      if(callback) callback(std::move(result));
    });
}

ShareResult<RemoteTranscription> SharingClient::transcribe(const std::string& connection_id,
                                                           std::vector<uint8_t> audio,
                                                           const TranscriptionContext& context) {
  return transcribe(connection_id, std::move(audio),
                    std::chrono::milliseconds(transcription_timeout(context)));
}

ShareResult<RemoteTranscription> SharingClient::transcribe(const std::string& connection_id,
                                                           std::vector<uint8_t> audio,
                                                           std::chrono::milliseconds timeout) {
  auto connection = registry_->get(connection_id);
  if(!connection) {
    return ShareResult<RemoteTranscription>::failure(ShareErrc::NotFound, "no saved connection " + connection_id);
  }
  if(connection->cached_status == ConnectionStatus::SelfConnection) {
    return ShareResult<RemoteTranscription>::failure(ShareErrc::SelfConnectionDetected,
      connection->label() + " is this machine's own server");
  }
  if(audio.empty()) {
    return ShareResult<RemoteTranscription>::failure(ShareErrc::InvalidArgument, "no audio to transcribe");
  }

  auto promise = std::make_shared<std::promise<ShareResult<RemoteTranscription>>>();
  auto future = promise->get_future();
  async_transcribe(*connection, std::move(audio), timeout, [promise](ShareResult<RemoteTranscription> result){
    promise->set_value(std::move(result));
  });
  auto result = future.get();
  if(result.ok()) {
    log_info(logger_.get(), "Transcribed by {} with '{}' in {} ms", connection->label(),
             result.value->model_used, result.value->duration_ms);
  } else {
    log_warn(logger_.get(), "Remote transcription failed: {}", result.error.describe());
  }
  return result;
}

ConnectionStatus SharingClient::apply_probe(const std::string& connection_id,
                                            const ShareResult<StatusResponse>& result) {
  auto prior = registry_->get(connection_id);
  if(!prior) return ConnectionStatus::Unknown;

  ProbeOutcome outcome;
  std::optional<std::string> model;
  if(result.ok()) {
    const bool same_machine = !local_machine_id_.empty() &&
                              result.value->machine_id == local_machine_id_;
    outcome = ProbeOutcome::success(same_machine);
    model = result.value->model;
  } else {
    outcome = ProbeOutcome::failure(probe_kind_of(result.error));
  }

  const auto status = classify(prior->cached_status, outcome);
  if(status != prior->cached_status) {
    log_info(logger_.get(), "{}: {} -> {} ({})", prior->label(), to_string(prior->cached_status),
             to_string(status), to_string(outcome.kind));
  }
  registry_->record_status(connection_id, status, model, unix_time_ms());
  return status;
}

ConnectionStatus SharingClient::check_status(const std::string& connection_id) {
  try {
    auto connection = registry_->get(connection_id);
    if(!connection) {
      log_warn(logger_.get(), "Status check for unknown connection {}", connection_id);
      return ConnectionStatus::Unknown;
    }
    auto result = test_connection(connection->host, connection->port, connection->password);
    return apply_probe(connection_id, result);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Status check for {} failed: {}", connection_id, e.what());
    return ConnectionStatus::Unknown;
  }
}
