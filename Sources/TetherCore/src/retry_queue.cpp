#include "tether/retry_queue.hpp"
#include "tether/log.hpp"
#include <algorithm>
#include <random>

namespace tether {

retry_class classify(const remote_error& error) {
    switch (error.kind) {
        case error_kind::network_unreachable:
        case error_kind::timeout:
        case error_kind::server:
        case error_kind::dependency_not_ready:
            return retry_class::retryable;
        case error_kind::auth_expired:
            return retry_class::refresh_auth;
        case error_kind::client:
            return retry_class::non_retryable;
    }
    return retry_class::non_retryable;
}

retry_policy retry_policy::from_config(const sync_config& config) {
    retry_policy p;
    p.base_delay = std::chrono::milliseconds(static_cast<int64_t>(config.base_delay_seconds * 1000));
    p.max_delay = std::chrono::milliseconds(static_cast<int64_t>(config.max_delay_seconds * 1000));
    p.max_attempts = config.max_attempts;
    p.jitter = config.jitter_fraction;
    return p;
}

retry_queue::retry_queue(retry_policy policy, clock_fn clock, jitter_fn jitter)
    : policy_(policy)
    , clock_(clock ? std::move(clock) : clock_fn(now_millis))
    , jitter_(std::move(jitter)) {
    if (!jitter_) {
        jitter_ = [] {
            static thread_local std::mt19937 gen(std::random_device{}());
            std::uniform_real_distribution<double> dis(-1.0, 1.0);
            return dis(gen);
        };
    }
}

std::chrono::milliseconds retry_queue::base_delay(int attempt) const {
    if (attempt < 1) attempt = 1;
    auto delay = policy_.base_delay;
    for (int i = 1; i < attempt && delay < policy_.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy_.max_delay);
}

std::chrono::milliseconds retry_queue::delay(int attempt) const {
    auto base = base_delay(attempt);
    double factor = 1.0 + policy_.jitter * std::clamp(jitter_(), -1.0, 1.0);
    return std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(base.count()) * factor));
}

schedule_outcome retry_queue::schedule(const std::string& record_id, const remote_error& error) {
    if (classify(error) == retry_class::non_retryable) {
        permanently_failed(record_id, error);
        return schedule_outcome::dropped;
    }

    auto& e = entries_[record_id];
    e.record_id = record_id;
    e.attempt_count += 1;
    e.classified_error = error;

    if (e.attempt_count >= policy_.max_attempts) {
        LOG_WARN("retry", "Giving up on %s after %d attempts: %s", record_id.c_str(),
                 e.attempt_count, error.describe().c_str());
        permanently_failed(record_id, error);
        return schedule_outcome::dropped;
    }

    auto now = clock_();
    e.last_attempt_at = now;
    e.next_attempt_at = now + delay(e.attempt_count);
    LOG_DEBUG("retry", "%s attempt %d failed (%s), next in %lld ms", record_id.c_str(),
              e.attempt_count, error.describe().c_str(),
              static_cast<long long>(std::chrono::duration_cast<millis_t>(e.next_attempt_at - now).count()));
    return schedule_outcome::rescheduled;
}

std::vector<std::string> retry_queue::due() const {
    auto now = clock_();
    std::vector<std::string> ids;
    for (const auto& [id, e] : entries_) {
        if (e.next_attempt_at <= now) ids.push_back(id);
    }
    return ids;
}

bool retry_queue::is_scheduled(const std::string& record_id) const {
    return entries_.count(record_id) > 0;
}

bool retry_queue::is_due(const std::string& record_id) const {
    if (is_permanent_failure(record_id)) return false;
    auto it = entries_.find(record_id);
    return it == entries_.end() || it->second.next_attempt_at <= clock_();
}

void retry_queue::succeeded(const std::string& record_id) {
    entries_.erase(record_id);
}

void retry_queue::permanently_failed(const std::string& record_id, const remote_error& error) {
    entries_.erase(record_id);
    permanent_[record_id] = error;
    LOG_ERROR("retry", "Permanent failure for %s: %s", record_id.c_str(), error.describe().c_str());
}

bool retry_queue::is_permanent_failure(const std::string& record_id) const {
    return permanent_.count(record_id) > 0;
}

void retry_queue::reset(const std::string& record_id) {
    entries_.erase(record_id);
    permanent_.erase(record_id);
}

void retry_queue::clear() {
    entries_.clear();
    permanent_.clear();
}

std::optional<retry_entry> retry_queue::entry(const std::string& record_id) const {
    auto it = entries_.find(record_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace tether
