#pragma once

#include "http_types.hpp"
#include <chrono>
#include <string>

namespace postrelay::network {

// One request in, one response out. Any status code is a response;
// only the absence of a usable response throws TransportError.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

struct ServerEndpoint {
    std::string host;
    std::string port;
    std::string base_path;

    // Accepts http://host[:port][/prefix]; throws std::invalid_argument otherwise.
    static ServerEndpoint parse(const std::string& url);

    std::string target_for(const std::string& path) const;
};

class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(const std::string& base_url,
                                std::chrono::milliseconds timeout = std::chrono::seconds(30));

    HttpResponse perform(const HttpRequest& request) override;

    const ServerEndpoint& endpoint() const { return endpoint_; }

private:
    ServerEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

}
