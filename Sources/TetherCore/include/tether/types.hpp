#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>

namespace tether {

// Wall-clock timestamp. Persisted and compared at millisecond precision.
using timestamp_t = std::chrono::system_clock::time_point;
using millis_t = std::chrono::milliseconds;

// Primary key type of local rows
using primary_key_t = int64_t;

// UUID type (stored as TEXT, lowercase hyphenated)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        // Set version (4) and variant (RFC 4122)
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }

    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }
};

// Supported column values
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

enum class column_type {
    integer,
    real,
    text,
    blob
};

// Column definition for schema
struct column_def {
    std::string name;
    column_type type;
    bool nullable = false;
    bool is_primary_key = false;
    bool is_unique = false;
};

// Secondary index. A non-empty where_clause makes it a partial index.
struct index_def {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    std::string where_clause;
};

// Table schema
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
    std::vector<index_def> indexes;
};

// ============================================================================
// Timestamp helpers
// ============================================================================

inline timestamp_t epoch() {
    return timestamp_t{};
}

inline int64_t to_millis(timestamp_t t) {
    return std::chrono::duration_cast<millis_t>(t.time_since_epoch()).count();
}

inline timestamp_t from_millis(int64_t ms) {
    return timestamp_t(millis_t(ms));
}

// Current time truncated to millisecond precision, so that values survive a
// round trip through storage and the wire unchanged.
inline timestamp_t now_millis() {
    return from_millis(to_millis(std::chrono::system_clock::now()));
}

// ISO-8601 in UTC with millisecond fraction, e.g. "2026-01-21T10:00:00.123Z"
std::string format_iso8601(timestamp_t t);

// Accepts "YYYY-MM-DDTHH:MM:SS", optional fraction of any length, and an
// optional "Z" or "+HH:MM"/"-HH:MM" offset. Returns nullopt when malformed.
std::optional<timestamp_t> parse_iso8601(const std::string& s);

namespace detail {
    inline column_value_t to_column_value(int64_t v) { return v; }
    inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
    inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    inline column_value_t to_column_value(const char* v) { return std::string(v); }
    inline column_value_t to_column_value(timestamp_t v) { return to_millis(v); }

    template<typename T>
    column_value_t to_column_value(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return to_column_value(*v);
    }

    inline bool is_null(const column_value_t& v) {
        return std::holds_alternative<std::nullptr_t>(v);
    }
} // namespace detail

} // namespace tether

#endif // __cplusplus
