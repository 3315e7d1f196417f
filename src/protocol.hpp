#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

using json = nlohmann::json;

// protocol.hpp - HTTP API shared by sharing servers and clients
inline constexpr uint16_t kDefaultSharingPort = 47842;
inline constexpr const char* kAuthHeader = "X-VoiceTypr-Key";
inline constexpr const char* kStatusPath = "/api/v1/status";
inline constexpr const char* kTranscribePath = "/api/v1/transcribe";
inline constexpr const char* kAudioContentType = "audio/wav";
inline constexpr std::size_t kMaxBodyBytes = 256 * 1024 * 1024;

const char* protocol_version();

struct StatusResponse {
    std::string status = "ok";
    std::string version;
    std::string model;
    std::string name;
    std::string machine_id;
};

struct TranscribeResponse {
    std::string text;
    uint64_t duration_ms = 0;
    std::string model;
};

json make_status_response(const StatusResponse& status);
json make_transcribe_response(const TranscribeResponse& response);
json make_error_response(const std::string& error);

bool parse_status_response(const std::string& body, StatusResponse& out, std::string& error);
bool parse_transcribe_response(const std::string& body, TranscribeResponse& out, std::string& error);
// Extracts `error` from an error body; empty when absent or unparsable.
std::string parse_error_message(const std::string& body);
