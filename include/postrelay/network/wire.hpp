#pragma once

#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace postrelay::network {

// A post as the remote service knows it. Server-assigned and immutable on the client.
struct ContentItem {
    std::string id;
    std::string text;
    std::string level;
    std::chrono::system_clock::time_point created_at;
};

struct StartSessionRequest {
    std::string text;
    std::string filename;
    uint64_t total_bytes = 0;
};

struct StartSessionResponse {
    std::string session_id;
    uint64_t next_offset = 0;
};

struct SessionStatus {
    std::string session_id;
    uint64_t offset = 0;
    uint64_t total_bytes = 0;
    bool complete = false;
};

namespace wire {

// Throws WireFormatError when the document is not valid JSON.
Json::Value parse_json(const std::string& body);
std::string to_json_string(const Json::Value& value);

Json::Value encode_text_body(const std::string& text);
Json::Value encode_start_session(const StartSessionRequest& request);

// Decoders throw WireFormatError on missing or mistyped fields.
ContentItem decode_content_item(const Json::Value& value);
std::vector<ContentItem> decode_timeline(const Json::Value& value);
StartSessionResponse decode_start_session(const Json::Value& value);
SessionStatus decode_session_status(const Json::Value& value);

// Best-effort extraction of {"message": "..."} error bodies; falls back to the raw body.
std::string error_message_from_body(const std::string& body);

}

}
