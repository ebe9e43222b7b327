#pragma once

#include "http_transport.hpp"
#include <json/json.h>
#include <map>
#include <string>

namespace postrelay::network {

using HeaderMap = std::map<std::string, std::string>;

// JSON conveniences over an HttpTransport. Does not own the transport.
class HttpClient {
public:
    explicit HttpClient(HttpTransport& transport);

    // Throws HttpStatusError on non-2xx and WireFormatError on an undecodable body.
    Json::Value get_json(const std::string& path, const HeaderMap& headers = {});

    Json::Value post_json(const std::string& path, const Json::Value& payload,
                          const HeaderMap& headers = {});

    // Returns whatever the server answered, without status enforcement.
    HttpResponse post_json_raw(const std::string& path, const Json::Value& payload,
                               const HeaderMap& headers = {});

    HttpResponse put_bytes(const std::string& path, std::string bytes,
                           const HeaderMap& headers = {});

    static HttpRequest make_request(const std::string& method, const std::string& path,
                                    const HeaderMap& headers = {});

    HttpTransport& transport() { return transport_; }

private:
    HttpTransport& transport_;

    HttpResponse send_json(const std::string& method, const std::string& path,
                           const Json::Value* payload, const HeaderMap& headers);
    static void ensure_success(const HttpResponse& response);
};

}
