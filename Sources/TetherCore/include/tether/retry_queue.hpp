#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "remote_client.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether {

enum class retry_class {
    retryable,
    non_retryable,
    refresh_auth    // refresh the token, then retry once without counting
};

retry_class classify(const remote_error& error);

struct retry_policy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    int max_attempts = 5;
    double jitter = 0.1;    // symmetric fraction of the delay

    static retry_policy from_config(const sync_config& config);
};

struct retry_entry {
    std::string record_id;
    int attempt_count = 0;
    timestamp_t last_attempt_at{};
    timestamp_t next_attempt_at{};
    remote_error classified_error;
};

enum class schedule_outcome {
    rescheduled,
    dropped     // permanent failure; see permanent_failures()
};

// ============================================================================
// RetryQueue - backoff schedule for failed pushes
// ============================================================================
//
// In memory only. After a restart the pending_sync scan finds the same
// records again and they start over at attempt 1. Not thread-safe: the sync
// coordinator's mailbox owns it.

class retry_queue {
public:
    using clock_fn = std::function<timestamp_t()>;
    /// Returns a value in [-1, 1]; scaled by the policy's jitter fraction.
    using jitter_fn = std::function<double()>;

    explicit retry_queue(retry_policy policy = {},
                         clock_fn clock = nullptr,
                         jitter_fn jitter = nullptr);

    /// Records a failed attempt. Non-retryable errors and exhausted attempt
    /// budgets drop the entry into the permanent-failure set.
    schedule_outcome schedule(const std::string& record_id, const remote_error& error);

    /// Ids whose next attempt time has passed
    std::vector<std::string> due() const;

    bool is_scheduled(const std::string& record_id) const;

    /// True if the record may be pushed now: not permanently failed and
    /// either unscheduled or past its next attempt time.
    bool is_due(const std::string& record_id) const;

    void succeeded(const std::string& record_id);
    void permanently_failed(const std::string& record_id, const remote_error& error);

    bool is_permanent_failure(const std::string& record_id) const;
    const std::map<std::string, remote_error>& permanent_failures() const { return permanent_; }

    /// Forgets the schedule and any permanent failure for one record, after
    /// a fresh local edit.
    void reset(const std::string& record_id);

    void clear();

    std::optional<retry_entry> entry(const std::string& record_id) const;
    size_t size() const { return entries_.size(); }

    /// Unjittered backoff for the given attempt number (1-based). Monotone
    /// non-decreasing and capped at max_delay.
    std::chrono::milliseconds base_delay(int attempt) const;

    /// base_delay with jitter applied
    std::chrono::milliseconds delay(int attempt) const;

    const retry_policy& policy() const { return policy_; }

private:
    retry_policy policy_;
    clock_fn clock_;
    jitter_fn jitter_;
    std::map<std::string, retry_entry> entries_;
    std::map<std::string, remote_error> permanent_;
};

} // namespace tether

#endif // __cplusplus
