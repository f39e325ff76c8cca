#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tether {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Sync Configuration
// ============================================================================

struct sync_config {
    // Retry backoff: delay(n) = min(base * 2^(n-1), max) +/- jitter
    double base_delay_seconds = 1.0;
    double max_delay_seconds = 60.0;
    int max_attempts = 5;
    double jitter_fraction = 0.1;

    size_t page_size = 500;             // records per pull page
    double safety_window_seconds = 300; // pull overlap for clock skew
    size_t push_batch_size = 50;        // records per upsert call

    /// Parses camelCase keys ("baseDelaySeconds", "pageSize", ...). Missing
    /// keys keep their defaults. Throws config_error on malformed JSON, wrong
    /// value types or out-of-range values.
    static sync_config from_json(const std::string& json);

    /// Throws config_error unless 0 < base_delay_seconds <= max_delay_seconds,
    /// max_attempts >= 1, jitter_fraction in [0, 1), page_size and
    /// push_batch_size positive and safety_window_seconds non-negative.
    void validate() const;
};

struct remote_config {
    std::string base_url;   // e.g. "https://project.example.co"
    std::string api_key;    // sent as the apikey header
};

struct store_config {
    std::string path = ":memory:";
};

} // namespace tether

#endif // __cplusplus
