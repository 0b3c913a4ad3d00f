#pragma once
#include <stdexcept>
#include <string>
#include <vector>

class CancelToken;

struct HttpRequest {
    std::string url;
    std::string body;
    std::vector<std::string> headers; // "Name: value" lines
    long timeout_ms{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Raised when no HTTP status was obtained (connect, DNS, timeout, abort).
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, bool cancelled)
        : std::runtime_error(what), cancelled_(cancelled) {}
    bool cancelled() const { return cancelled_; }

private:
    bool cancelled_;
};

// Keeps libcurl's global state alive; create one in main before starting threads.
class CurlGlobalScope {
public:
    CurlGlobalScope();
    ~CurlGlobalScope();
    CurlGlobalScope(const CurlGlobalScope&) = delete;
    CurlGlobalScope& operator=(const CurlGlobalScope&) = delete;
};

HttpResponse http_post(const HttpRequest& req, const CancelToken& cancel);
