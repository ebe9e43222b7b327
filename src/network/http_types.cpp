#include "postrelay/network/http_types.hpp"
#include "postrelay/core/utils.hpp"

namespace postrelay::network {

using postrelay::core::utils::StringUtils;

namespace {

std::string describe_status(int status, const std::string& body) {
    auto trimmed = StringUtils::trim(body);
    if (trimmed.empty()) {
        return "Request failed with HTTP " + std::to_string(status) + ".";
    }
    return "Request failed with HTTP " + std::to_string(status) + ": " + trimmed;
}

}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    entries_[StringUtils::to_lower(name)] = value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = entries_.find(StringUtils::to_lower(name));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpStatusError::HttpStatusError(int status, std::string body)
    : std::runtime_error(describe_status(status, body))
    , status_(status)
    , body_(std::move(body)) {
}

}
