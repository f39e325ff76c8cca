#pragma once

#ifdef __cplusplus

#include "change_tracker.hpp"
#include "config.hpp"
#include "conflict_resolver.hpp"
#include "local_store.hpp"
#include "remote_client.hpp"
#include "retry_queue.hpp"
#include "scheduler.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether {

class sync_cancelled : public std::runtime_error {
public:
    explicit sync_cancelled(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Sync status snapshot
// ============================================================================

struct sync_status {
    std::optional<timestamp_t> last_sync_at;
    size_t pending_count = 0;
    bool is_syncing = false;
    std::optional<std::string> last_error;
    std::map<std::string, remote_error> permanent_failures;

    /// "Syncing...", "Sync failed: <error>", "Last synced 5m ago" or "Not synced"
    std::string status_text(timestamp_t now = now_millis()) const;
};

// ============================================================================
// SyncCoordinator
// ============================================================================
//
// All orchestration state (cycle guards, retry schedule, in-flight set,
// account, status) lives on a private serial scheduler, the mailbox. Push and
// pull cycles run on their own worker schedulers and hop onto the mailbox for
// every state read or write. The mailbox never waits on a worker, and a worker
// never waits on the mailbox while it holds a store transaction.

class sync_coordinator {
public:
    using on_permanent_failure_handler = std::function<void(const std::string& record_id,
                                                            const remote_error& error)>;
    using on_state_change_handler = std::function<void(const sync_status& status)>;

    /// Throws config_error if the config does not validate.
    sync_coordinator(local_store& store, remote_client& remote, auth_provider& auth,
                     const sync_config& config, std::string account_id,
                     retry_queue::clock_fn clock = nullptr);

    ~sync_coordinator();

    // Non-copyable, non-moveable
    sync_coordinator(const sync_coordinator&) = delete;
    sync_coordinator& operator=(const sync_coordinator&) = delete;
    sync_coordinator(sync_coordinator&&) = delete;
    sync_coordinator& operator=(sync_coordinator&&) = delete;

    /// Pushes pending records in dependency order. Returns a ready future if
    /// a push is already running. The future throws db_error if the local
    /// store failed and sync_cancelled if the cycle was cancelled; per-record
    /// remote failures go to the retry queue instead.
    std::future<void> push_pending_changes();

    /// Merges remote changes since the cursor. Returns a ready future if a
    /// pull is already running. The cursor only advances when every page of
    /// every entity type was merged.
    std::future<void> pull_updates();

    /// Pull, then push. The push runs even if the pull failed, unless the
    /// pull was cancelled; the future reports the pull's error first.
    std::future<void> perform_sync();

    /// A local write happened. Clears any permanent failure for the record and
    /// starts a push. A record already in flight is not sent again; it stays
    /// pending and goes out with the next cycle.
    void enqueue(const std::string& record_id);

    sync_status sync_state();

    /// Logout: cancels running cycles at the next record or page boundary and
    /// forgets retry and permanent-failure state. pending_sync flags survive.
    void cancel();

    /// cancel() plus a new account scope whose cursor starts at epoch.
    void switch_account(const std::string& account_id);

    std::string account_id();

    // Event handlers. Set them before the first cycle; they may run on any thread.
    void set_on_permanent_failure(on_permanent_failure_handler handler) { on_permanent_failure_ = std::move(handler); }
    void set_on_state_change(on_state_change_handler handler) { on_state_change_ = std::move(handler); }

private:
    using completion_fn = std::function<void(std::exception_ptr)>;

    struct cycle_ticket {
        bool started = false;
        uint64_t generation = 0;
        std::string account_id;
    };

    local_store& store_;
    remote_client& remote_;
    auth_provider& auth_;
    sync_config config_;

    // Mailbox-owned state
    std::string account_id_;
    change_tracker tracker_;
    retry_queue retry_;
    bool is_pushing_ = false;
    bool is_pulling_ = false;
    bool push_again_ = false;
    std::optional<timestamp_t> last_sync_at_;
    std::optional<std::string> last_error_;

    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> closing_{false};

    on_permanent_failure_handler on_permanent_failure_;
    on_state_change_handler on_state_change_;

    std::unique_ptr<std_thread_scheduler> push_worker_;
    std::unique_ptr<std_thread_scheduler> pull_worker_;
    std::unique_ptr<std_thread_scheduler> mailbox_;

    // Runs fn on the mailbox and waits for its result. Runs inline when the
    // caller is already on the mailbox.
    template<typename F>
    auto on_mailbox(F&& fn) -> decltype(fn()) {
        if (mailbox_->is_on_thread()) {
            return fn();
        }
        std::packaged_task<decltype(fn())()> task(std::forward<F>(fn));
        auto result = task.get_future();
        mailbox_->invoke([&task] { task(); });
        return result.get();
    }

    void start_push(completion_fn done);
    void start_pull(completion_fn done);

    // Returns a description of the last per-record failure, if any.
    std::optional<std::string> run_push_cycle(const cycle_ticket& ticket);
    void run_pull_cycle(const cycle_ticket& ticket);

    std::vector<upsert_result> call_upsert(entity_type type, const std::vector<record>& batch);
    std::vector<upsert_result> send_batch(entity_type type, const std::vector<record>& batch,
                                          bool& refreshed);
    void confirm_pushed(const record& pushed, const upsert_result& result);
    timestamp_t merge_page(entity_type type, const std::vector<remote_snapshot>& page);

    void check_cancelled(uint64_t generation) const;
    void publish_state();
};

} // namespace tether

#endif // __cplusplus
