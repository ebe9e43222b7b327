#include "postrelay/network/http_client.hpp"
#include "postrelay/network/wire.hpp"

namespace postrelay::network {

HttpClient::HttpClient(HttpTransport& transport)
    : transport_(transport) {
}

HttpRequest HttpClient::make_request(const std::string& method, const std::string& path,
                                     const HeaderMap& headers) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    for (const auto& [name, value] : headers) {
        request.headers.set(name, value);
    }
    return request;
}

Json::Value HttpClient::get_json(const std::string& path, const HeaderMap& headers) {
    auto response = send_json("GET", path, nullptr, headers);
    ensure_success(response);
    return wire::parse_json(response.body);
}

Json::Value HttpClient::post_json(const std::string& path, const Json::Value& payload,
                                  const HeaderMap& headers) {
    auto response = send_json("POST", path, &payload, headers);
    ensure_success(response);
    if (response.body.empty()) {
        return Json::Value(Json::nullValue);
    }
    return wire::parse_json(response.body);
}

HttpResponse HttpClient::post_json_raw(const std::string& path, const Json::Value& payload,
                                       const HeaderMap& headers) {
    return send_json("POST", path, &payload, headers);
}

HttpResponse HttpClient::put_bytes(const std::string& path, std::string bytes,
                                   const HeaderMap& headers) {
    auto request = make_request("PUT", path, headers);
    if (!request.headers.contains("Content-Type")) {
        request.headers.set("Content-Type", "application/octet-stream");
    }
    request.body = std::move(bytes);
    return transport_.perform(request);
}

HttpResponse HttpClient::send_json(const std::string& method, const std::string& path,
                                   const Json::Value* payload, const HeaderMap& headers) {
    auto request = make_request(method, path, headers);
    if (payload) {
        request.headers.set("Content-Type", "application/json");
        request.body = wire::to_json_string(*payload);
    }
    request.headers.set("Accept", "application/json");
    return transport_.perform(request);
}

void HttpClient::ensure_success(const HttpResponse& response) {
    if (!response.is_success()) {
        throw HttpStatusError(response.status, response.body);
    }
}

}
