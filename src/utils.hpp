#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

std::string local_host_name();

// Stable identity of this machine, shared by every instance running on it.
// Derived from /etc/machine-id (host name as fallback) and hashed so the
// raw id never leaves the host.
std::string local_machine_id();

uint64_t unix_time_ms();
std::string generate_connection_id();

std::string trim_copy(std::string value);

bool read_file_bytes(const std::filesystem::path& path,
                     std::vector<uint8_t>& out,
                     std::string& error);

// Duration of a RIFF/WAVE payload from its fmt and data chunks.
std::optional<double> wav_duration_seconds(const std::vector<uint8_t>& wav);
