#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations. The platform layer supplies the
// implementation (URLSession, OkHttp, libcurl, ...). A status_code of 0 means
// no response was received at all.

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    // Synchronous request (blocks until complete). Called from sync worker
    // threads only.
    virtual http_response send(const http_request& request) = 0;
};

// ============================================================================
// Factory for creating platform-specific clients
// ============================================================================

class network_factory {
public:
    virtual ~network_factory() = default;

    virtual std::unique_ptr<http_client> create_http_client() = 0;
};

// Global factory registration (set by platform layer)
void set_network_factory(std::shared_ptr<network_factory> factory);
std::shared_ptr<network_factory> get_network_factory();

// ============================================================================
// Offline implementation - used until the platform registers a factory
// ============================================================================

class null_http_client : public http_client {
public:
    http_response send(const http_request&) override {
        return http_response{0, {}, {}};  // No connectivity
    }
};

class null_network_factory : public network_factory {
public:
    std::unique_ptr<http_client> create_http_client() override {
        return std::make_unique<null_http_client>();
    }
};

} // namespace tether

#endif // __cplusplus
