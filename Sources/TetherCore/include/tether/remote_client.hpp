#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "network.hpp"
#include "record.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// Remote errors
// ============================================================================

enum class error_kind {
    network_unreachable,
    timeout,
    server,                 // 5xx
    client,                 // 4xx other than 401, validation or malformed payload
    auth_expired,           // 401
    dependency_not_ready    // foreign key violation or parent deferred locally
};

std::string to_string(error_kind kind);

struct remote_error {
    error_kind kind = error_kind::network_unreachable;
    int status_code = 0;
    std::string message;

    std::string describe() const;

    bool operator==(const remote_error& other) const = default;
};

/// Whole-call failure: nothing in the call was applied remotely.
class remote_exception : public std::runtime_error {
public:
    explicit remote_exception(remote_error error)
        : std::runtime_error(error.describe()), error_(std::move(error)) {}

    const remote_error& error() const noexcept { return error_; }

private:
    remote_error error_;
};

class auth_error : public std::runtime_error {
public:
    explicit auth_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Authentication capability
// ============================================================================

class auth_provider {
public:
    virtual ~auth_provider() = default;

    virtual std::string access_token() = 0;

    /// Obtains a fresh access token. Throws auth_error if that is impossible.
    virtual std::string refresh_token() = 0;
};

// ============================================================================
// Remote client interface
// ============================================================================

struct upsert_result {
    std::string record_id;
    std::optional<remote_snapshot> accepted;   // row as the remote stored it
    std::optional<remote_error> error;

    bool ok() const { return !error.has_value(); }
};

/// Position in the (updated_at, id) ordering
struct page_key {
    timestamp_t updated_at{};
    std::string id;

    bool operator==(const page_key& other) const = default;
};

struct fetch_request {
    std::string owner_id;
    timestamp_t since{};     // exclusive lower bound on updated_at
    std::optional<page_key> after;  // exclusive; the previous page's last key
    size_t page_size = 500;
};

struct fetch_page {
    std::vector<remote_snapshot> records;  // ordered by (updated_at, id)
    bool has_more = false;
    std::optional<page_key> last;  // continuation for the next request
};

class remote_client {
public:
    virtual ~remote_client() = default;

    /// Upsert-by-id. One result per input record, in input order. Throws
    /// remote_exception only when the call as a whole could not be made.
    virtual std::vector<upsert_result> upsert(entity_type type,
                                              const std::vector<record>& records) = 0;

    /// Throws remote_exception on any failure.
    virtual fetch_page fetch_since(entity_type type, const fetch_request& request) = 0;
};

// ============================================================================
// PostgREST client over http_client
// ============================================================================

class http_remote_client : public remote_client {
public:
    http_remote_client(std::unique_ptr<http_client> http, auth_provider& auth, remote_config config);

    /// Uses the client from the registered network_factory.
    http_remote_client(auth_provider& auth, remote_config config);

    std::vector<upsert_result> upsert(entity_type type,
                                      const std::vector<record>& records) override;
    fetch_page fetch_since(entity_type type, const fetch_request& request) override;

    /// Maps a non-2xx response to an error. Exposed for tests.
    static remote_error classify_response(const http_response& response);

private:
    std::unique_ptr<http_client> http_;
    auth_provider& auth_;
    remote_config config_;

    http_request make_request(const std::string& method, const std::string& path_and_query);
    upsert_result upsert_one(entity_type type, const record& r);
};

} // namespace tether

#endif // __cplusplus
