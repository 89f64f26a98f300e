#pragma once
#include <stdexcept>
#include <string>
#include <vector>

struct HttpRequest {
    std::string method = "GET";   // "GET" or "POST"
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Raised when no HTTP response was obtained at all (DNS, connect, TLS, timeout).
class TransportFailure : public std::runtime_error {
public:
    TransportFailure(const std::string& what, bool timed_out)
        : std::runtime_error(what), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Returns any HTTP response, including non-2xx. Throws TransportFailure otherwise.
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_seconds);

    HttpResponse send(const HttpRequest& req) override;

private:
    long timeout_seconds_;
};
