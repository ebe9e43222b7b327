#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace postrelay::network {

// Header names are stored lowercased; lookups are case-insensitive.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const { return get(name).has_value(); }

    const std::map<std::string, std::string>& entries() const { return entries_; }

private:
    std::map<std::string, std::string> entries_;
};

struct HttpRequest {
    std::string method = "GET";
    std::string path = "/";
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    bool is_success() const { return status >= 200 && status <= 299; }
};

enum class TransportErrorKind {
    CONNECTIVITY,
    TIMEOUT,
    INVALID_RESPONSE
};

// No usable HTTP response: DNS, connect, I/O, deadline, or a malformed reply.
class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    TransportErrorKind kind() const { return kind_; }

private:
    TransportErrorKind kind_;
};

class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(int status, std::string body);

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

class WireFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
