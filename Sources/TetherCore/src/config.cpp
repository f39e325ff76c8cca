#include "tether/config.hpp"
#include "tether/log.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace tether {

using json = nlohmann::json;

namespace {

template<typename T>
void read_number(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_number()) {
        throw config_error(std::string("Config key '") + key + "' must be a number");
    }
    if constexpr (std::is_integral_v<T>) {
        if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
            throw config_error(std::string("Config key '") + key + "' must be a non-negative integer");
        }
        if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw config_error(std::string("Config key '") + key + "' is out of range");
        }
    }
    out = v.get<T>();
}

} // namespace

void sync_config::validate() const {
    if (base_delay_seconds <= 0 || max_delay_seconds < base_delay_seconds) {
        throw config_error("Retry delays must satisfy 0 < baseDelaySeconds <= maxDelaySeconds");
    }
    if (max_attempts < 1) {
        throw config_error("maxAttempts must be at least 1");
    }
    if (jitter_fraction < 0 || jitter_fraction >= 1) {
        throw config_error("jitterFraction must be in [0, 1)");
    }
    if (page_size == 0 || push_batch_size == 0) {
        throw config_error("pageSize and pushBatchSize must be positive");
    }
    if (safety_window_seconds < 0) {
        throw config_error("safetyWindowSeconds must not be negative");
    }
}

sync_config sync_config::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("Malformed sync config: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("Sync config must be a JSON object");
    }

    sync_config config;
    read_number(j, "baseDelaySeconds", config.base_delay_seconds);
    read_number(j, "maxDelaySeconds", config.max_delay_seconds);
    read_number(j, "maxAttempts", config.max_attempts);
    read_number(j, "jitterFraction", config.jitter_fraction);
    read_number(j, "pageSize", config.page_size);
    read_number(j, "safetyWindowSeconds", config.safety_window_seconds);
    read_number(j, "pushBatchSize", config.push_batch_size);

    config.validate();

    LOG_DEBUG("config", "page_size=%zu batch=%zu max_attempts=%d",
              config.page_size, config.push_batch_size, config.max_attempts);
    return config;
}

} // namespace tether
