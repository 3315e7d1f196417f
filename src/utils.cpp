#include "utils.hpp"
#include <openssl/sha.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace {

uint32_t read_le32(const std::vector<uint8_t>& b, std::size_t at){
    return static_cast<uint32_t>(b[at]) |
           (static_cast<uint32_t>(b[at + 1]) << 8) |
           (static_cast<uint32_t>(b[at + 2]) << 16) |
           (static_cast<uint32_t>(b[at + 3]) << 24);
}

uint16_t read_le16(const std::vector<uint8_t>& b, std::size_t at){
    return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

std::string read_first_line(const char* path){
    std::ifstream in(path);
    std::string line;
    if(in) std::getline(in, line);
    return trim_copy(line);
}

} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string local_host_name(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
        return "VoiceShare Server";
    }
    return hostname;
}

std::string local_machine_id(){
    std::string raw = read_first_line("/etc/machine-id");
    if(raw.empty()) raw = read_first_line("/var/lib/dbus/machine-id");
    if(raw.empty()) raw = "host:" + local_host_name();
    return sha256_hex("voiceshare-machine:" + raw).substr(0, 32);
}

uint64_t unix_time_ms(){
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string generate_connection_id(){
    static std::atomic<uint64_t> counter{0};
    return "conn_" + std::to_string(unix_time_ms()) + "_" + std::to_string(counter.fetch_add(1));
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

bool read_file_bytes(const std::filesystem::path& path,
                     std::vector<uint8_t>& out,
                     std::string& error){
    std::ifstream in(path, std::ios::binary);
    if(!in){
        error = "cannot open " + path.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if(in.bad()){
        error = "read failed for " + path.string();
        return false;
    }
    return true;
}

std::optional<double> wav_duration_seconds(const std::vector<uint8_t>& wav){
    if(wav.size() < 12) return std::nullopt;
    if(std::string(wav.begin(), wav.begin() + 4) != "RIFF" ||
       std::string(wav.begin() + 8, wav.begin() + 12) != "WAVE") {
        return std::nullopt;
    }
    uint32_t byte_rate = 0;
    std::optional<uint32_t> data_size;
    std::size_t pos = 12;
    while(pos + 8 <= wav.size()) {
        std::string id(wav.begin() + pos, wav.begin() + pos + 4);
        uint32_t size = read_le32(wav, pos + 4);
        std::size_t body = pos + 8;
        if(id == "fmt " && body + 16 <= wav.size()) {
            // channels @2, sample rate @4, byte rate @8
            if(read_le16(wav, body + 2) == 0) return std::nullopt;
            byte_rate = read_le32(wav, body + 8);
        } else if(id == "data") {
            // Streaming writers leave the size unset; use what is present.
            std::size_t available = wav.size() - body;
            data_size = static_cast<uint32_t>(std::min<std::size_t>(size, available));
            break;
        }
        pos = body + size + (size & 1u);
    }
    if(byte_rate == 0 || !data_size) return std::nullopt;
    return static_cast<double>(*data_size) / static_cast<double>(byte_rate);
}
