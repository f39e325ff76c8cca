#include "tether/sync.hpp"
#include "tether/log.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace tether {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

namespace {

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

const sync_config& validated(const sync_config& config) {
    config.validate();
    return config;
}

bool is_cancellation(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const sync_cancelled&) {
        return true;
    } catch (...) {
        return false;
    }
}

} // namespace

// ============================================================================
// sync_status
// ============================================================================

std::string sync_status::status_text(timestamp_t now) const {
    if (is_syncing) return "Syncing...";
    if (last_error) return "Sync failed: " + *last_error;
    if (!last_sync_at) return "Not synced";

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now - *last_sync_at).count();
    if (seconds < 0) seconds = 0;
    if (seconds < 60) return "Last synced " + std::to_string(seconds) + "s ago";
    if (seconds < 3600) return "Last synced " + std::to_string(seconds / 60) + "m ago";
    if (seconds < 86400) return "Last synced " + std::to_string(seconds / 3600) + "h ago";
    return "Last synced " + std::to_string(seconds / 86400) + "d ago";
}

// ============================================================================
// sync_coordinator implementation
// ============================================================================

sync_coordinator::sync_coordinator(local_store& store, remote_client& remote, auth_provider& auth,
                                   const sync_config& config, std::string account_id,
                                   retry_queue::clock_fn clock)
    : store_(store)
    , remote_(remote)
    , auth_(auth)
    , config_(validated(config))
    , account_id_(std::move(account_id))
    , tracker_(store)
    , retry_(retry_policy::from_config(config), std::move(clock))
    , push_worker_(std::make_unique<std_thread_scheduler>())
    , pull_worker_(std::make_unique<std_thread_scheduler>())
    , mailbox_(std::make_unique<std_thread_scheduler>())
{
    LOG_INFO("sync", "Coordinator ready for account %s", account_id_.c_str());
}

sync_coordinator::~sync_coordinator() {
    closing_ = true;
    cancel();
    // Workers first: their queued cycles still hop onto the mailbox while
    // draining. The pull worker can start a push, so it goes before the
    // push worker.
    pull_worker_.reset();
    push_worker_.reset();
    mailbox_.reset();
}

std::string sync_coordinator::account_id() {
    return on_mailbox([this] { return account_id_; });
}

void sync_coordinator::check_cancelled(uint64_t generation) const {
    if (generation_.load() != generation) {
        throw sync_cancelled("Sync cycle cancelled");
    }
}

void sync_coordinator::publish_state() {
    if (!on_state_change_) return;
    try {
        on_state_change_(sync_state());
    } catch (const db_error& e) {
        LOG_ERROR("sync", "Could not read sync state: %s", e.what());
    }
}

sync_status sync_coordinator::sync_state() {
    auto [status, account] = on_mailbox([this] {
        sync_status s;
        s.last_sync_at = last_sync_at_;
        s.is_syncing = is_pushing_ || is_pulling_;
        s.last_error = last_error_;
        s.permanent_failures = retry_.permanent_failures();
        return std::make_pair(s, account_id_);
    });
    status.pending_count = tracker_.pending_count(account);
    return status;
}

void sync_coordinator::cancel() {
    on_mailbox([this] {
        generation_.fetch_add(1);
        retry_.clear();
        push_again_ = false;
    });
    LOG_INFO("sync", "Sync cancelled");
}

void sync_coordinator::switch_account(const std::string& account_id) {
    on_mailbox([this, &account_id] {
        generation_.fetch_add(1);
        retry_.clear();
        push_again_ = false;
        account_id_ = account_id;
        last_sync_at_.reset();
        last_error_.reset();
    });
    store_.store_cursor(account_id, epoch());
    LOG_INFO("sync", "Switched to account %s", account_id.c_str());
    publish_state();
}

void sync_coordinator::enqueue(const std::string& record_id) {
    bool start = on_mailbox([this, &record_id] {
        retry_.reset(record_id);
        if (tracker_.is_in_flight(record_id)) {
            LOG_DEBUG("sync", "%s is in flight, leaving it for the next cycle", record_id.c_str());
            return false;
        }
        if (is_pushing_) {
            push_again_ = true;
            return false;
        }
        return true;
    });
    if (start) {
        start_push([](std::exception_ptr) {});
    }
}

// ============================================================================
// Cycle entry points
// ============================================================================

std::future<void> sync_coordinator::push_pending_changes() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    start_push([promise](std::exception_ptr error) {
        if (error) promise->set_exception(error);
        else promise->set_value();
    });
    return future;
}

std::future<void> sync_coordinator::pull_updates() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    start_pull([promise](std::exception_ptr error) {
        if (error) promise->set_exception(error);
        else promise->set_value();
    });
    return future;
}

std::future<void> sync_coordinator::perform_sync() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    start_pull([this, promise](std::exception_ptr pull_error) {
        if (pull_error && is_cancellation(pull_error)) {
            promise->set_exception(pull_error);
            return;
        }
        start_push([promise, pull_error](std::exception_ptr push_error) {
            if (pull_error) promise->set_exception(pull_error);
            else if (push_error) promise->set_exception(push_error);
            else promise->set_value();
        });
    });
    return future;
}

void sync_coordinator::start_push(completion_fn done) {
    if (closing_) {
        done(std::make_exception_ptr(sync_cancelled("Coordinator is shutting down")));
        return;
    }

    auto ticket = on_mailbox([this] {
        cycle_ticket t;
        if (is_pushing_ || closing_) return t;
        is_pushing_ = true;
        t.started = true;
        t.generation = generation_.load();
        t.account_id = account_id_;
        return t;
    });
    if (!ticket.started) {
        if (closing_) {
            done(std::make_exception_ptr(sync_cancelled("Coordinator is shutting down")));
            return;
        }
        LOG_DEBUG("sync", "Push already running");
        done(nullptr);
        return;
    }
    publish_state();

    push_worker_->invoke([this, ticket, done = std::move(done)] {
        std::exception_ptr error;
        std::optional<std::string> failure;
        try {
            failure = run_push_cycle(ticket);
        } catch (...) {
            error = std::current_exception();
        }

        bool again = on_mailbox([&] {
            is_pushing_ = false;
            if (error) {
                if (!is_cancellation(error)) last_error_ = describe(error);
            } else if (failure) {
                last_error_ = failure;
            } else {
                last_error_.reset();
                last_sync_at_ = now_millis();
            }
            return std::exchange(push_again_, false) && generation_.load() == ticket.generation;
        });

        if (error) {
            LOG_ERROR("sync", "Push cycle aborted: %s", describe(error).c_str());
        }
        publish_state();
        done(error);

        if (again && !error && !closing_) {
            start_push([](std::exception_ptr) {});
        }
    });
}

void sync_coordinator::start_pull(completion_fn done) {
    if (closing_) {
        done(std::make_exception_ptr(sync_cancelled("Coordinator is shutting down")));
        return;
    }

    auto ticket = on_mailbox([this] {
        cycle_ticket t;
        if (is_pulling_ || closing_) return t;
        is_pulling_ = true;
        t.started = true;
        t.generation = generation_.load();
        t.account_id = account_id_;
        return t;
    });
    if (!ticket.started) {
        if (closing_) {
            done(std::make_exception_ptr(sync_cancelled("Coordinator is shutting down")));
            return;
        }
        LOG_DEBUG("sync", "Pull already running");
        done(nullptr);
        return;
    }
    publish_state();

    pull_worker_->invoke([this, ticket, done = std::move(done)] {
        std::exception_ptr error;
        try {
            run_pull_cycle(ticket);
        } catch (...) {
            error = std::current_exception();
        }

        on_mailbox([&] {
            is_pulling_ = false;
            if (error) {
                if (!is_cancellation(error)) last_error_ = describe(error);
            } else {
                last_error_.reset();
                last_sync_at_ = now_millis();
            }
        });

        if (error) {
            LOG_ERROR("sync", "Pull cycle aborted: %s", describe(error).c_str());
        }
        publish_state();
        done(error);
    });
}

// ============================================================================
// Push cycle
// ============================================================================

std::vector<upsert_result> sync_coordinator::call_upsert(entity_type type,
                                                         const std::vector<record>& batch) {
    std::vector<upsert_result> returned;
    try {
        returned = remote_.upsert(type, batch);
    } catch (const remote_exception& e) {
        LOG_WARN("sync", "Upsert of %zu %s record(s) failed: %s", batch.size(),
                 to_string(type).c_str(), e.what());
        std::vector<upsert_result> failed;
        for (const auto& r : batch) {
            failed.push_back({r.id, std::nullopt, e.error()});
        }
        return failed;
    }

    // Line results up with the batch by id
    std::map<std::string, upsert_result> by_id;
    for (auto& result : returned) {
        auto id = result.record_id;
        by_id.emplace(std::move(id), std::move(result));
    }

    std::vector<upsert_result> results;
    results.reserve(batch.size());
    for (const auto& r : batch) {
        auto it = by_id.find(r.id);
        if (it != by_id.end()) {
            results.push_back(std::move(it->second));
        } else {
            results.push_back({r.id, std::nullopt,
                               remote_error{error_kind::server, 0, "No result for record"}});
        }
    }
    return results;
}

std::vector<upsert_result> sync_coordinator::send_batch(entity_type type,
                                                        const std::vector<record>& batch,
                                                        bool& refreshed) {
    auto results = call_upsert(type, batch);

    std::vector<record> expired;
    std::vector<size_t> positions;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].error && classify(*results[i].error) == retry_class::refresh_auth) {
            expired.push_back(batch[i]);
            positions.push_back(i);
        }
    }
    if (expired.empty() || refreshed) {
        return results;
    }

    // One refresh per cycle; the retry does not count as an attempt
    refreshed = true;
    try {
        auth_.refresh_token();
    } catch (const auth_error& e) {
        LOG_WARN("sync", "Token refresh failed: %s", e.what());
        return results;
    }

    LOG_INFO("sync", "Token refreshed, retrying %zu record(s)", expired.size());
    auto retried = call_upsert(type, expired);
    for (size_t k = 0; k < retried.size(); ++k) {
        results[positions[k]] = std::move(retried[k]);
    }
    return results;
}

void sync_coordinator::confirm_pushed(const record& pushed, const upsert_result& result) {
    auto txn = store_.begin();
    auto current = txn->find(pushed.type, pushed.id);
    if (!current) {
        LOG_WARN("sync", "%s %s vanished during push", to_string(pushed.type).c_str(), pushed.id.c_str());
        return;
    }
    if (current->updated_at != pushed.updated_at) {
        // Edited while in flight; the newer state goes out next cycle
        LOG_DEBUG("sync", "%s changed during push, stays pending", pushed.id.c_str());
        return;
    }

    current->pending_sync = false;
    if (result.accepted && result.accepted->updated_at > current->updated_at) {
        current->updated_at = result.accepted->updated_at;
    }
    txn->update(*current);
    txn->save();
}

std::optional<std::string> sync_coordinator::run_push_cycle(const cycle_ticket& ticket) {
    check_cancelled(ticket.generation);

    std::map<entity_type, std::vector<record>> pending;
    for (auto type : dependency_order) {
        pending[type] = tracker_.pending_records(type, ticket.account_id);
    }

    // Records that must not be treated as present on the remote this cycle.
    // Starts with everything pending that we are not allowed to send now.
    std::set<std::string> blocked;
    std::map<entity_type, std::vector<record>> claimed;
    std::vector<std::string> claimed_ids;

    on_mailbox([&] {
        for (auto& [type, records] : pending) {
            for (auto& r : records) {
                if (!retry_.is_due(r.id) || !tracker_.mark_in_flight(r.id)) {
                    blocked.insert(r.id);
                    continue;
                }
                claimed_ids.push_back(r.id);
                claimed[type].push_back(std::move(r));
            }
        }
    });

    if (claimed_ids.empty()) {
        LOG_DEBUG("sync", "Nothing to push");
        return std::nullopt;
    }

    size_t pushed = 0, failed = 0, deferred = 0;
    std::optional<std::string> last_failure;
    std::vector<std::pair<std::string, remote_error>> dropped;
    bool refreshed = false;

    auto record_outcomes = [&](const std::vector<std::string>& succeeded,
                               const std::vector<std::pair<std::string, remote_error>>& failures) {
        on_mailbox([&] {
            // cancel() or switch_account() already reset the retry state
            if (generation_.load() != ticket.generation) return;
            for (const auto& id : succeeded) {
                retry_.succeeded(id);
            }
            for (const auto& [id, error] : failures) {
                if (retry_.schedule(id, error) == schedule_outcome::dropped) {
                    dropped.emplace_back(id, error);
                }
            }
        });
    };

    try {
        for (auto type : dependency_order) {
            auto it = claimed.find(type);
            if (it == claimed.end()) continue;

            std::vector<record> sendable;
            std::vector<std::pair<std::string, remote_error>> deferrals;
            for (auto& r : it->second) {
                check_cancelled(ticket.generation);
                std::optional<std::string> blocking_parent;
                for (const auto& [parent_type, parent_id] : r.parent_refs()) {
                    if (blocked.count(parent_id)) {
                        blocking_parent = parent_id;
                        break;
                    }
                }
                if (blocking_parent) {
                    deferrals.emplace_back(r.id, remote_error{error_kind::dependency_not_ready, 0,
                                                              "parent " + *blocking_parent + " not synced"});
                    blocked.insert(r.id);
                    continue;
                }
                sendable.push_back(std::move(r));
            }
            if (!deferrals.empty()) {
                deferred += deferrals.size();
                LOG_INFO("sync", "Deferred %zu %s record(s) behind unsynced parents",
                         deferrals.size(), to_string(type).c_str());
                record_outcomes({}, deferrals);
            }

            for (size_t start = 0; start < sendable.size(); start += config_.push_batch_size) {
                check_cancelled(ticket.generation);
                size_t end = std::min(sendable.size(), start + config_.push_batch_size);
                std::vector<record> batch(sendable.begin() + start, sendable.begin() + end);

                auto results = send_batch(type, batch, refreshed);
                check_cancelled(ticket.generation);

                std::vector<std::string> succeeded;
                std::vector<std::pair<std::string, remote_error>> failures;
                for (size_t i = 0; i < batch.size(); ++i) {
                    if (results[i].ok()) {
                        confirm_pushed(batch[i], results[i]);
                        succeeded.push_back(batch[i].id);
                    } else {
                        blocked.insert(batch[i].id);
                        last_failure = results[i].error->describe();
                        failures.emplace_back(batch[i].id, *results[i].error);
                    }
                }
                pushed += succeeded.size();
                failed += failures.size();
                record_outcomes(succeeded, failures);
            }
        }
    } catch (...) {
        on_mailbox([&] {
            for (const auto& id : claimed_ids) tracker_.clear_in_flight(id);
        });
        throw;
    }

    on_mailbox([&] {
        for (const auto& id : claimed_ids) tracker_.clear_in_flight(id);
    });

    check_cancelled(ticket.generation);
    for (const auto& [id, error] : dropped) {
        if (on_permanent_failure_) on_permanent_failure_(id, error);
    }

    LOG_INFO("sync", "Push cycle: %zu pushed, %zu failed, %zu deferred", pushed, failed, deferred);
    return last_failure;
}

// ============================================================================
// Pull cycle
// ============================================================================

timestamp_t sync_coordinator::merge_page(entity_type type, const std::vector<remote_snapshot>& page) {
    timestamp_t newest = epoch();
    size_t inserted = 0, applied = 0, kept = 0;

    auto txn = store_.begin();
    for (const auto& snapshot : page) {
        newest = std::max(newest, snapshot.updated_at);

        auto local = txn->find(type, snapshot.id);
        auto res = conflict_resolver::resolve(local, snapshot);
        switch (res.outcome) {
            case merge_outcome::inserted_remote:
                txn->insert(res.result);
                ++inserted;
                break;
            case merge_outcome::applied_remote:
                txn->update(res.result);
                ++applied;
                break;
            case merge_outcome::kept_local_pending:
            case merge_outcome::kept_local_newer:
                ++kept;
                break;
        }
    }
    txn->save();

    LOG_DEBUG("sync", "Merged %s page: %zu inserted, %zu updated, %zu kept", to_string(type).c_str(),
              inserted, applied, kept);
    return newest;
}

void sync_coordinator::run_pull_cycle(const cycle_ticket& ticket) {
    check_cancelled(ticket.generation);

    auto cursor = store_.load_cursor(ticket.account_id);
    auto window = std::chrono::duration_cast<millis_t>(
        std::chrono::duration<double>(config_.safety_window_seconds));
    auto since = cursor - window < epoch() ? epoch() : cursor - window;
    auto newest = cursor;

    LOG_DEBUG("sync", "Pull for %s since %s", ticket.account_id.c_str(), format_iso8601(since).c_str());

    size_t total = 0;
    for (auto type : dependency_order) {
        fetch_request request;
        request.owner_id = ticket.account_id;
        request.since = since;
        request.page_size = config_.page_size;

        while (true) {
            check_cancelled(ticket.generation);
            auto page = remote_.fetch_since(type, request);
            if (!page.records.empty()) {
                newest = std::max(newest, merge_page(type, page.records));
                total += page.records.size();
            }
            if (!page.has_more) break;
            if (!page.last) {
                throw remote_exception({error_kind::server, 0,
                                        "Full " + to_string(type) + " page without a readable row"});
            }
            request.after = std::move(page.last);
        }
    }

    check_cancelled(ticket.generation);
    if (newest > cursor) {
        store_.store_cursor(ticket.account_id, newest);
    }
    LOG_INFO("sync", "Pull cycle: %zu record(s) merged", total);
}

} // namespace tether
