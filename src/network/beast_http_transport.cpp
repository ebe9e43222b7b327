#include "postrelay/network/http_transport.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace postrelay::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using postrelay::core::utils::StringUtils;

ServerEndpoint ServerEndpoint::parse(const std::string& url) {
    const std::string scheme = "http://";
    auto trimmed = StringUtils::trim(url);
    if (!StringUtils::starts_with(StringUtils::to_lower(trimmed), scheme)) {
        throw std::invalid_argument("Only http:// base URLs are supported: " + url);
    }

    auto rest = trimmed.substr(scheme.size());
    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);

    if (authority.empty()) {
        throw std::invalid_argument("Missing host in base URL: " + url);
    }

    ServerEndpoint endpoint;
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
    } else {
        endpoint.host = authority;
        endpoint.port = "80";
    }

    if (endpoint.host.empty() || endpoint.port.empty()) {
        throw std::invalid_argument("Malformed base URL: " + url);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    endpoint.base_path = path;
    return endpoint;
}

std::string ServerEndpoint::target_for(const std::string& path) const {
    if (path.empty()) {
        return base_path.empty() ? "/" : base_path;
    }
    if (path.front() == '/') {
        return base_path + path;
    }
    return base_path + "/" + path;
}

BeastHttpTransport::BeastHttpTransport(const std::string& base_url, std::chrono::milliseconds timeout)
    : endpoint_(ServerEndpoint::parse(base_url))
    , timeout_(timeout) {
}

HttpResponse BeastHttpTransport::perform(const HttpRequest& request) {
    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    auto target = endpoint_.target_for(request.path);
    LOG_DEBUG("{} {}:{}{} ({} bytes)", request.method, endpoint_.host, endpoint_.port,
              target, request.body.size());

    // One io_context per call keeps the transport usable from any thread.
    net::io_context ioc;
    beast::tcp_stream stream(ioc);

    try {
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(endpoint_.host, endpoint_.port);

        stream.expires_after(timeout_);
        stream.connect(results);

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, endpoint_.host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        for (const auto& [name, value] : request.headers.entries()) {
            req.set(name, value);
        }
        req.body() = request.body;
        req.prepare_payload();

        stream.expires_after(timeout_);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(64 * 1024 * 1024);
        stream.expires_after(timeout_);
        http::read(stream, buffer, parser);

        auto res = parser.release();

        HttpResponse response;
        response.status = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            auto name = field.name_string();
            auto value = field.value();
            response.headers.set(std::string(name.data(), name.size()),
                                 std::string(value.data(), value.size()));
        }
        response.body = std::move(res.body());

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            LOG_DEBUG("Socket shutdown after {} {}: {}", request.method, target, ec.message());
        }

        return response;
    } catch (const boost::system::system_error& e) {
        if (e.code() == beast::error::timeout) {
            throw TransportError(TransportErrorKind::TIMEOUT,
                                 "The request timed out: " + request.method + " " + target);
        }
        if (e.code().category() == http::make_error_code(http::error::end_of_stream).category()) {
            throw TransportError(TransportErrorKind::INVALID_RESPONSE,
                                 "The server returned an invalid response: " + e.code().message());
        }
        throw TransportError(TransportErrorKind::CONNECTIVITY,
                             "Could not reach " + endpoint_.host + ":" + endpoint_.port + ": " + e.code().message());
    }
}

}
