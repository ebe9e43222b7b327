#include "postrelay/network/wire.hpp"
#include "postrelay/network/http_types.hpp"
#include "postrelay/core/utils.hpp"
#include <cmath>
#include <memory>

namespace postrelay::network::wire {

using postrelay::core::utils::StringUtils;
using postrelay::core::utils::TimeUtils;

namespace {

const Json::Value& require_member(const Json::Value& object, const char* name) {
    if (!object.isObject() || !object.isMember(name)) {
        throw WireFormatError(std::string("Missing field: ") + name);
    }
    return object[name];
}

std::string require_string(const Json::Value& object, const char* name) {
    const auto& value = require_member(object, name);
    if (!value.isString()) {
        throw WireFormatError(std::string("Field is not a string: ") + name);
    }
    return value.asString();
}

uint64_t require_uint64(const Json::Value& object, const char* name) {
    const auto& value = require_member(object, name);
    if (value.isUInt64()) {
        return value.asUInt64();
    }
    // JavaScript servers may send integral doubles. 2^64 itself does not fit.
    if (value.isDouble()) {
        double number = value.asDouble();
        if (std::isfinite(number) && number >= 0.0 && number < 18446744073709551616.0 &&
            std::floor(number) == number) {
            return static_cast<uint64_t>(number);
        }
    }
    throw WireFormatError(std::string("Field is not a non-negative integer: ") + name);
}

}

Json::Value parse_json(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw WireFormatError("Failed to decode response: " + errors);
    }
    return root;
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value encode_text_body(const std::string& text) {
    Json::Value body(Json::objectValue);
    body["text"] = text;
    return body;
}

Json::Value encode_start_session(const StartSessionRequest& request) {
    Json::Value body(Json::objectValue);
    body["text"] = request.text;
    body["filename"] = request.filename;
    body["totalBytes"] = Json::UInt64(request.total_bytes);
    return body;
}

ContentItem decode_content_item(const Json::Value& value) {
    ContentItem item;
    item.id = require_string(value, "id");
    item.text = require_string(value, "text");
    item.level = require_string(value, "level");

    auto created = TimeUtils::from_iso_string(require_string(value, "createdAt"));
    if (!created) {
        throw WireFormatError("Field is not an ISO-8601 date: createdAt");
    }
    item.created_at = *created;
    return item;
}

std::vector<ContentItem> decode_timeline(const Json::Value& value) {
    const auto& tweets = require_member(value, "tweets");
    if (!tweets.isArray()) {
        throw WireFormatError("Field is not an array: tweets");
    }

    std::vector<ContentItem> items;
    items.reserve(tweets.size());
    for (const auto& tweet : tweets) {
        items.push_back(decode_content_item(tweet));
    }
    return items;
}

StartSessionResponse decode_start_session(const Json::Value& value) {
    StartSessionResponse response;
    response.session_id = require_string(value, "sessionId");
    response.next_offset = require_uint64(value, "nextOffset");
    return response;
}

SessionStatus decode_session_status(const Json::Value& value) {
    SessionStatus status;
    status.session_id = require_string(value, "sessionId");
    status.offset = require_uint64(value, "offset");
    status.total_bytes = require_uint64(value, "totalBytes");

    const auto& complete = require_member(value, "complete");
    if (!complete.isBool()) {
        throw WireFormatError("Field is not a boolean: complete");
    }
    status.complete = complete.asBool();
    return status;
}

std::string error_message_from_body(const std::string& body) {
    auto trimmed = StringUtils::trim(body);
    if (trimmed.empty() || trimmed.front() != '{') {
        return trimmed;
    }

    try {
        auto root = parse_json(trimmed);
        if (root.isObject() && root["message"].isString()) {
            return root["message"].asString();
        }
    } catch (const WireFormatError&) {
        // Not JSON after all; report the raw text.
    }
    return trimmed;
}

}
