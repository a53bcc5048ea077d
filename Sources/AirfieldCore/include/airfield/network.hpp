#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <map>
#include <stdexcept>
#include <cstdint>

namespace airfield {

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations. Implementations:
// - curl_http_client (libcurl, used by the command-line app)
// - mock_http_client (tests)

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }

    static http_response from_string(int status, const std::string& s) {
        http_response r;
        r.status_code = status;
        r.body = std::vector<uint8_t>(s.begin(), s.end());
        return r;
    }
};

// Requests carry no body; the search index is read with GETs only.
struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
};

/// Thrown by an http_client when no response could be obtained at all
/// (DNS, connect, TLS, timeout). HTTP error statuses are returned, not thrown.
class transport_error : public std::runtime_error {
public:
    explicit transport_error(const std::string& msg) : std::runtime_error(msg) {}
};

class http_client {
public:
    virtual ~http_client() = default;

    // Synchronous request (blocks until complete)
    virtual http_response send(const http_request& request) = 0;
};

// ============================================================================
// libcurl client
// ============================================================================

struct curl_options {
    long timeout_seconds = 30;
    std::string username;   // empty = no authentication
    std::string password;
    std::string user_agent = "airfield/1.0";
};

class curl_http_client : public http_client {
public:
    explicit curl_http_client(curl_options options = {});
    ~curl_http_client() override;

    // Non-copyable
    curl_http_client(const curl_http_client&) = delete;
    curl_http_client& operator=(const curl_http_client&) = delete;

    http_response send(const http_request& request) override;

private:
    curl_options options_;
    void* handle_ = nullptr;  // CURL*, created on first request
};

/// Percent-encode a query-string component with curl_easy_escape
/// (RFC 3986 unreserved chars kept). Throws transport_error if libcurl fails.
std::string url_encode(const std::string& value);

// ============================================================================
// Mock implementation for testing
// ============================================================================

/// Answers every request through a caller-supplied handler and keeps a copy
/// of each request it saw.
class mock_http_client : public http_client {
public:
    using handler_t = std::function<http_response(const http_request&)>;

    explicit mock_http_client(handler_t handler) : handler_(std::move(handler)) {}

    http_response send(const http_request& request) override {
        sent_requests_.push_back(request);
        return handler_(request);
    }

    const std::vector<http_request>& get_sent_requests() const {
        return sent_requests_;
    }

    void clear_sent_requests() { sent_requests_.clear(); }

private:
    handler_t handler_;
    std::vector<http_request> sent_requests_;
};

} // namespace airfield
