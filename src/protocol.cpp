#include "protocol.hpp"

#ifndef VOICESHARE_VERSION
#define VOICESHARE_VERSION "0.0.0"
#endif

const char* protocol_version(){
    return VOICESHARE_VERSION;
}

json make_status_response(const StatusResponse& status){
    json j;
    j["status"] = status.status;
    j["version"] = status.version;
    j["model"] = status.model;
    j["name"] = status.name;
    j["machine_id"] = status.machine_id;
    return j;
}

json make_transcribe_response(const TranscribeResponse& response){
    json j;
    j["text"] = response.text;
    j["duration_ms"] = response.duration_ms;
    j["model"] = response.model;
    return j;
}

json make_error_response(const std::string& error){
    json j;
    j["error"] = error;
    return j;
}

bool parse_status_response(const std::string& body, StatusResponse& out, std::string& error){
    try {
        auto j = json::parse(body);
        if(!j.is_object() || !j.contains("model") || !j.at("model").is_string()){
            error = "status response missing 'model'";
            return false;
        }
        out.status = j.value("status", "ok");
        out.version = j.value("version", "");
        out.model = j.at("model").get<std::string>();
        out.name = j.value("name", "");
        // Servers predating machine identity omit the field.
        out.machine_id = j.value("machine_id", "");
        return true;
    } catch(const json::exception& e){
        error = std::string("invalid status response: ") + e.what();
        return false;
    }
}

bool parse_transcribe_response(const std::string& body, TranscribeResponse& out, std::string& error){
    try {
        auto j = json::parse(body);
        if(!j.is_object() || !j.contains("text") || !j.at("text").is_string()){
            error = "invalid response: missing 'text' field";
            return false;
        }
        out.text = j.at("text").get<std::string>();
        out.duration_ms = j.value("duration_ms", uint64_t{0});
        out.model = j.value("model", "");
        return true;
    } catch(const json::exception& e){
        error = std::string("invalid transcribe response: ") + e.what();
        return false;
    }
}

std::string parse_error_message(const std::string& body){
    auto j = json::parse(body, nullptr, false);
    if(j.is_discarded() || !j.is_object()) return "";
    auto it = j.find("error");
    if(it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}
