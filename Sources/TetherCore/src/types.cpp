#include "tether/types.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace tether {

std::string format_iso8601(timestamp_t t) {
    int64_t ms = to_millis(t);
    int64_t secs = ms / 1000;
    int64_t rem = ms % 1000;
    if (rem < 0) {
        rem += 1000;
        secs -= 1;
    }

    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(rem));
    return out;
}

std::optional<timestamp_t> parse_iso8601(const std::string& s) {
    if (s.size() < 19) return std::nullopt;
    if (s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != ' ') || s[13] != ':' || s[16] != ':') {
        return std::nullopt;
    }

    auto digits = [&s](size_t from, size_t count, int& out) {
        out = 0;
        for (size_t i = from; i < from + count; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
            out = out * 10 + (s[i] - '0');
        }
        return true;
    };

    int year, month, day, hour, minute, second;
    if (!digits(0, 4, year) || !digits(5, 2, month) || !digits(8, 2, day) ||
        !digits(11, 2, hour) || !digits(14, 2, minute) || !digits(17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int count = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (count < 3) millis = millis * 10 + (s[pos] - '0');
            ++count;
            ++pos;
        }
        if (count == 0) return std::nullopt;
        for (int i = count; i < 3; ++i) millis *= 10;
    }

    int64_t offset_minutes = 0;
    if (pos < s.size()) {
        char c = s[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int sign = (c == '+') ? 1 : -1;
            ++pos;
            int oh = 0, om = 0;
            if (pos + 2 > s.size() || !digits(pos, 2, oh)) return std::nullopt;
            pos += 2;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (pos + 2 <= s.size()) {
                if (!digits(pos, 2, om)) return std::nullopt;
                pos += 2;
            }
            offset_minutes = sign * (oh * 60 + om);
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t secs = timegm(&tm);

    int64_t total = static_cast<int64_t>(secs) * 1000 + millis - offset_minutes * 60 * 1000;
    return from_millis(total);
}

} // namespace tether
