#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace sync_tests {

using namespace tether;
using namespace test_support;

// ============================================================================
// Test fixture: in-memory store, fake remote, controllable retry clock
// ============================================================================

inline sync_config quick_config() {
    sync_config config;
    config.jitter_fraction = 0.0;
    return config;
}

struct fixture {
    sqlite_local_store store;
    fake_remote remote;
    fake_auth auth;
    std::atomic<int64_t> clock_ms{1000000};
    std::unique_ptr<sync_coordinator> coordinator;

    explicit fixture(const sync_config& config = quick_config()) {
        coordinator = std::make_unique<sync_coordinator>(store, remote, auth, config, kOwner,
            [this] { return at(clock_ms.load()); });
    }

    void advance(int64_t ms) { clock_ms += ms; }

    bool is_pending(const record& r) {
        auto found = store.find(r.type, r.id);
        return found && found->pending_sync;
    }

    size_t pending_count(const std::string& owner = kOwner) {
        size_t n = 0;
        for (auto type : dependency_order) {
            record_query q;
            q.type = type;
            q.owner_id = owner;
            q.pending_only = true;
            q.include_deleted = true;
            n += store.count(q);
        }
        return n;
    }
};

template<typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

// ============================================================================
// Scenario: push, then a newer remote edit arrives by pull
// ============================================================================

void test_push_then_pull_newer_remote() {
    std::cout << "  test_push_then_pull_newer_remote..." << std::flush;

    fixture f;
    auto a = make_session(at(1000));
    f.store.write(a);

    f.coordinator->push_pending_changes().get();
    assert(!f.is_pending(a));
    assert(f.remote.get(entity_type::session, a.id));

    // Another device edits A
    auto remote_a = *f.remote.get(entity_type::session, a.id);
    remote_a.fields["notes"] = std::string("from the gym laptop");
    remote_a.updated_at = at(5000);
    f.remote.put(remote_a);

    f.coordinator->pull_updates().get();
    auto local = f.store.find(entity_type::session, a.id);
    assert(local->get_text("notes") == "from the gym laptop");
    assert(local->updated_at == at(5000));
    assert(!local->pending_sync);
    assert(f.store.load_cursor(kOwner) >= at(5000));

    auto status = f.coordinator->sync_state();
    assert(status.last_sync_at);
    assert(!status.last_error);
    assert(status.pending_count == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Scenario: pending local edit survives a newer pull, then wins on push
// ============================================================================

void test_pending_local_survives_pull() {
    std::cout << "  test_pending_local_survives_pull..." << std::flush;

    fixture f;
    auto b = make_session(at(1000));
    f.store.write(b);
    f.coordinator->push_pending_changes().get();

    b.set("notes", std::string("local edit"));
    mark_modified(b, at(3000));
    f.store.write(b);

    auto remote_b = *f.remote.get(entity_type::session, b.id);
    remote_b.fields["notes"] = std::string("remote edit");
    remote_b.updated_at = at(4000);
    f.remote.put(remote_b);

    f.coordinator->pull_updates().get();
    auto local = f.store.find(entity_type::session, b.id);
    assert(local->get_text("notes") == "local edit");
    assert(local->updated_at == at(3000));
    assert(local->pending_sync);

    // The server stamps the accepted row; the local copy adopts that time
    f.remote.set_server_clock([] { return at(9000); });
    f.coordinator->push_pending_changes().get();
    local = f.store.find(entity_type::session, b.id);
    assert(!local->pending_sync);
    assert(local->updated_at == at(9000));
    assert(f.remote.get(entity_type::session, b.id)->fields.at("notes") == column_value_t(std::string("local edit")));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Scenario: a rejected record becomes a permanent failure after one attempt
// ============================================================================

void test_rejected_record_is_permanent() {
    std::cout << "  test_rejected_record_is_permanent..." << std::flush;

    // Must outlive the coordinator
    std::vector<std::pair<std::string, remote_error>> reported;
    fixture f;
    f.coordinator->set_on_permanent_failure([&](const std::string& id, const remote_error& error) {
        reported.emplace_back(id, error);
    });

    auto c = make_session(at(1000));
    f.store.write(c);
    remote_error invalid{error_kind::client, 400, "rpe out of range"};
    f.remote.fail_record(c.id, invalid, 1);

    f.coordinator->push_pending_changes().get();
    assert(f.is_pending(c));
    assert(f.remote.upserts_of(c.id) == 1);
    assert(reported.size() == 1 && reported[0].first == c.id && reported[0].second == invalid);

    auto status = f.coordinator->sync_state();
    assert(status.permanent_failures.count(c.id) == 1);
    assert(status.permanent_failures.at(c.id) == invalid);
    assert(status.last_error);
    assert(status.pending_count == 1);

    // Not retried by later cycles
    f.advance(3600000);
    f.coordinator->push_pending_changes().get();
    assert(f.remote.upserts_of(c.id) == 1);

    // A fresh local edit clears the failure and pushes again
    c.set("rpe", int64_t(7));
    mark_modified(c, at(2000));
    f.store.write(c);
    f.coordinator->enqueue(c.id);
    assert(eventually([&] { return !f.is_pending(c); }));
    assert(f.remote.upserts_of(c.id) == 2);
    assert(eventually([&] { return f.coordinator->sync_state().permanent_failures.empty(); }));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Scenario: parents go out before children regardless of write order
// ============================================================================

void test_parents_pushed_first() {
    std::cout << "  test_parents_pushed_first..." << std::flush;

    fixture f;
    auto session = make_session(at(1000));
    auto climb = make_climb(session, at(1000));
    auto attempt = make_attempt(climb, 1, at(1000));

    // Children written first
    f.store.write(attempt);
    f.store.write(climb);
    f.store.write(session);

    f.coordinator->push_pending_changes().get();

    auto calls = f.remote.calls();
    assert(calls.size() == 3);
    assert(calls[0].type == entity_type::session);
    assert(calls[1].type == entity_type::climb);
    assert(calls[2].type == entity_type::attempt);
    assert(!f.is_pending(session) && !f.is_pending(climb) && !f.is_pending(attempt));
    assert(f.remote.upserts_of(climb.id) == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_children_deferred_behind_failed_parent
// ============================================================================

void test_children_deferred_behind_failed_parent() {
    std::cout << "  test_children_deferred_behind_failed_parent..." << std::flush;

    fixture f;
    auto session = make_session(at(1000));
    auto climb = make_climb(session, at(1000));
    f.store.write(session);
    f.store.write(climb);

    f.remote.fail_record(session.id, {error_kind::server, 503, "unavailable"}, 1);
    f.coordinator->push_pending_changes().get();

    assert(f.remote.upserts_of(session.id) == 1);
    assert(f.remote.upserts_of(climb.id) == 0);
    assert(f.is_pending(session) && f.is_pending(climb));
    assert(f.coordinator->sync_state().permanent_failures.empty());

    // Both are backing off
    f.coordinator->push_pending_changes().get();
    assert(f.remote.upserts_of(session.id) == 1);

    f.advance(1000);
    f.coordinator->push_pending_changes().get();
    assert(!f.is_pending(session) && !f.is_pending(climb));
    auto calls = f.remote.calls();
    assert(calls.back().type == entity_type::climb);
    assert(calls[calls.size() - 2].type == entity_type::session);

    // A child whose parent the remote has never seen is told to wait
    auto orphan = make_climb(make_session(at(1000)), at(1000));
    f.store.write(orphan);
    f.coordinator->push_pending_changes().get();
    assert(f.remote.upserts_of(orphan.id) == 1);
    assert(f.is_pending(orphan));
    assert(f.coordinator->sync_state().permanent_failures.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_single_push_in_flight - overlapping triggers never double-send
// ============================================================================

void test_single_push_in_flight() {
    std::cout << "  test_single_push_in_flight..." << std::flush;

    std::mutex seen_mutex;
    std::vector<bool> syncing_seen;

    fixture f;
    std::promise<void> gate;
    f.remote.hold_upserts(gate.get_future().share());

    f.coordinator->set_on_state_change([&](const sync_status& status) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        syncing_seen.push_back(status.is_syncing);
    });

    auto s = make_session(at(1000));
    f.store.write(s);

    auto first = f.coordinator->push_pending_changes();
    assert(eventually([&] { return f.remote.in_upsert(); }));
    assert(f.coordinator->sync_state().is_syncing);

    // A second trigger while the first is running completes immediately
    auto second = f.coordinator->push_pending_changes();
    assert(second.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    second.get();

    // S is edited while in flight; T is new
    s.set("notes", std::string("edited mid-push"));
    mark_modified(s, at(2000));
    f.store.write(s);
    f.coordinator->enqueue(s.id);

    auto t = make_session(at(1500));
    f.store.write(t);
    f.coordinator->enqueue(t.id);

    gate.set_value();
    first.get();

    // The follow-up cycle carries both the newer S and T
    assert(eventually([&] { return !f.is_pending(s) && !f.is_pending(t); }));
    assert(f.remote.upserts_of(s.id) == 2);
    assert(f.remote.upserts_of(t.id) == 1);
    assert(f.remote.get(entity_type::session, s.id)->updated_at == at(2000));
    assert(eventually([&] { return !f.coordinator->sync_state().is_syncing; }));

    {
        std::lock_guard<std::mutex> lock(seen_mutex);
        assert(std::find(syncing_seen.begin(), syncing_seen.end(), true) != syncing_seen.end());
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pull_pagination_and_cursor
// ============================================================================

void test_pull_pagination_and_cursor() {
    std::cout << "  test_pull_pagination_and_cursor..." << std::flush;

    auto config = quick_config();
    config.page_size = 2;
    fixture f(config);

    std::vector<remote_snapshot> rows;
    for (int i = 1; i <= 5; ++i) {
        auto snap = remote_snapshot::of(make_session(at(i * 1000)));
        f.remote.put(snap);
        rows.push_back(snap);
    }
    f.remote.put(remote_snapshot::of(make_session(at(6000), kOtherOwner)));

    f.coordinator->pull_updates().get();

    // Sessions in three pages, one empty page for each other type
    assert(f.remote.fetch_count() == 8);
    record_query q;
    q.type = entity_type::session;
    assert(f.store.count(q) == 5);
    assert(f.pending_count() == 0);
    assert(f.store.load_cursor(kOwner) == at(5000));

    // An older row inside the safety window still arrives; the cursor holds
    auto late = remote_snapshot::of(make_session(at(4500)));
    f.remote.put(late);
    f.coordinator->pull_updates().get();
    assert(f.store.find(entity_type::session, late.id));
    assert(f.store.load_cursor(kOwner) == at(5000));

    // A failure part way through leaves the cursor where it was
    auto newest = remote_snapshot::of(make_session(at(8000)));
    f.remote.put(newest);
    f.remote.fail_fetches_after(1);
    auto failed = f.coordinator->pull_updates();
    assert(throws<remote_exception>([&] { failed.get(); }));
    assert(f.store.load_cursor(kOwner) == at(5000));
    assert(!f.store.find(entity_type::session, newest.id));

    auto status = f.coordinator->sync_state();
    assert(status.last_error);
    assert(status.status_text().rfind("Sync failed: ", 0) == 0);

    f.remote.fail_fetches_after(-1);
    f.coordinator->pull_updates().get();
    assert(f.store.find(entity_type::session, newest.id));
    assert(f.store.load_cursor(kOwner) == at(8000));
    assert(!f.coordinator->sync_state().last_error);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pull_survives_edit_between_pages - rows moving behind the read
// position are not skipped
// ============================================================================

void test_pull_survives_edit_between_pages() {
    std::cout << "  test_pull_survives_edit_between_pages..." << std::flush;

    auto config = quick_config();
    config.page_size = 2;
    fixture f(config);

    std::vector<remote_snapshot> rows;
    for (int i = 1; i <= 4; ++i) {
        auto snap = remote_snapshot::of(make_session(at(i * 3600000)));
        f.remote.put(snap);
        rows.push_back(snap);
    }

    // Another device edits the first row after the first page was read
    auto edited_at = at(11 * 3600000);
    f.remote.before_fetch([&](int fetch_number) {
        if (fetch_number != 2) return;
        auto moved = rows[0];
        moved.fields["notes"] = std::string("edited mid-pull");
        moved.updated_at = edited_at;
        f.remote.put(moved);
    });

    f.coordinator->pull_updates().get();

    for (const auto& row : rows) {
        assert(f.store.find(entity_type::session, row.id));
    }
    auto first = f.store.find(entity_type::session, rows[0].id);
    assert(first->updated_at == edited_at);
    assert(first->get_text("notes") == "edited mid-pull");
    assert(f.store.load_cursor(kOwner) == edited_at);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_auth_refresh - one refresh per cycle, 401 does not cost an attempt
// ============================================================================

void test_auth_refresh() {
    std::cout << "  test_auth_refresh..." << std::flush;

    {
        fixture f;
        f.remote.require_token([&f] { return f.auth.access_token() != "token-0"; });

        auto s = make_session(at(1000));
        f.store.write(s);
        f.coordinator->push_pending_changes().get();

        assert(f.auth.refresh_count() == 1);
        assert(f.remote.upserts_of(s.id) == 2);
        assert(!f.is_pending(s));
        assert(!f.coordinator->sync_state().last_error);
    }

    {
        auto config = quick_config();
        config.max_attempts = 2;
        fixture f(config);
        f.auth.fail_refresh(true);
        f.remote.require_token([] { return false; });

        auto s = make_session(at(1000));
        f.store.write(s);
        f.coordinator->push_pending_changes().get();

        assert(f.auth.refresh_count() == 1);
        assert(f.remote.upserts_of(s.id) == 1);
        assert(f.is_pending(s));
        assert(f.coordinator->sync_state().permanent_failures.empty());

        // Scheduled for later, not before
        f.coordinator->push_pending_changes().get();
        assert(f.remote.upserts_of(s.id) == 1);

        f.advance(1000);
        f.coordinator->push_pending_changes().get();
        assert(f.remote.upserts_of(s.id) == 2);
        assert(f.auth.refresh_count() == 2);
        assert(f.coordinator->sync_state().permanent_failures.count(s.id) == 1);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_cancel - running cycles stop, schedules are forgotten
// ============================================================================

void test_cancel() {
    std::cout << "  test_cancel..." << std::flush;

    {
        auto config = quick_config();
        config.push_batch_size = 1;
        fixture f(config);

        std::promise<void> gate;
        f.remote.hold_upserts(gate.get_future().share());
        f.store.write(make_session(at(1000)));
        f.store.write(make_session(at(1000)));

        auto running = f.coordinator->push_pending_changes();
        assert(eventually([&] { return f.remote.in_upsert(); }));
        f.coordinator->cancel();
        gate.set_value();

        assert(throws<sync_cancelled>([&] { running.get(); }));
        assert(f.remote.calls().size() == 1);
        // The batch that came back after cancel() is not confirmed
        assert(f.pending_count() == 2);
        assert(!f.coordinator->sync_state().last_error);
    }

    {
        fixture f;
        auto s = make_session(at(1000));
        f.store.write(s);
        f.remote.fail_record(s.id, {error_kind::server, 500, "boom"});

        f.coordinator->push_pending_changes().get();
        f.coordinator->push_pending_changes().get();
        assert(f.remote.upserts_of(s.id) == 1);

        // Backoff is forgotten, the pending flag is not
        f.coordinator->cancel();
        assert(f.is_pending(s));
        f.coordinator->push_pending_changes().get();
        assert(f.remote.upserts_of(s.id) == 2);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_switch_account - new scope, cursor from epoch
// ============================================================================

void test_switch_account() {
    std::cout << "  test_switch_account..." << std::flush;

    fixture f;
    auto mine = make_session(at(1000));
    auto theirs = make_session(at(1000), kOtherOwner);
    f.store.write(mine);
    f.store.write(theirs);
    f.store.store_cursor(kOtherOwner, at(7000));

    auto old_row = remote_snapshot::of(make_session(at(2000), kOtherOwner));
    f.remote.put(old_row);

    assert(f.coordinator->sync_state().pending_count == 1);

    f.coordinator->switch_account(kOtherOwner);
    assert(f.coordinator->account_id() == kOtherOwner);
    assert(f.store.load_cursor(kOtherOwner) == epoch());
    assert(f.coordinator->sync_state().pending_count == 1);
    assert(!f.coordinator->sync_state().last_sync_at);

    f.coordinator->perform_sync().get();
    assert(f.store.find(entity_type::session, old_row.id));
    assert(!f.is_pending(theirs));
    assert(f.is_pending(mine));
    assert(f.remote.upserts_of(mine.id) == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_switch_account_during_push - a batch returning after the switch
// leaves no trace on the new account
// ============================================================================

void test_switch_account_during_push() {
    std::cout << "  test_switch_account_during_push..." << std::flush;

    // Must outlive the coordinator
    std::vector<std::pair<std::string, remote_error>> reported;
    fixture f;
    f.coordinator->set_on_permanent_failure([&](const std::string& id, const remote_error& error) {
        reported.emplace_back(id, error);
    });

    auto s = make_session(at(1000));
    f.store.write(s);
    f.remote.fail_record(s.id, {error_kind::client, 400, "rpe out of range"}, 1);

    std::promise<void> gate;
    f.remote.hold_upserts(gate.get_future().share());
    auto running = f.coordinator->push_pending_changes();
    assert(eventually([&] { return f.remote.in_upsert(); }));

    f.coordinator->switch_account(kOtherOwner);
    gate.set_value();

    assert(throws<sync_cancelled>([&] { running.get(); }));
    assert(reported.empty());
    assert(f.coordinator->sync_state().permanent_failures.empty());
    assert(!f.coordinator->sync_state().last_error);
    assert(f.pending_count(kOwner) == 1);

    // Switching back finds the record ready to push, with no backoff
    f.coordinator->switch_account(kOwner);
    f.coordinator->push_pending_changes().get();
    assert(!f.is_pending(s));
    assert(f.remote.upserts_of(s.id) == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_invalid_config_rejected - the coordinator refuses unusable settings
// ============================================================================

void test_invalid_config_rejected() {
    std::cout << "  test_invalid_config_rejected..." << std::flush;

    sqlite_local_store store;
    fake_remote remote;
    fake_auth auth;

    auto rejects = [&](const sync_config& config) {
        return throws<config_error>([&] {
            sync_coordinator coordinator(store, remote, auth, config, kOwner);
        });
    };

    auto config = quick_config();
    config.push_batch_size = 0;
    assert(rejects(config));

    config = quick_config();
    config.page_size = 0;
    assert(rejects(config));

    config = quick_config();
    config.max_attempts = 0;
    assert(rejects(config));

    config = quick_config();
    config.base_delay_seconds = 10;
    config.max_delay_seconds = 1;
    assert(rejects(config));

    config = quick_config();
    config.jitter_fraction = 1.0;
    assert(rejects(config));

    assert(!rejects(quick_config()));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_perform_sync - pull then push, push survives a failed pull
// ============================================================================

void test_perform_sync() {
    std::cout << "  test_perform_sync..." << std::flush;

    fixture f;
    auto remote_row = remote_snapshot::of(make_session(at(2000)));
    f.remote.put(remote_row);
    auto local = make_session(at(3000));
    f.store.write(local);

    f.coordinator->perform_sync().get();
    assert(f.store.find(entity_type::session, remote_row.id));
    assert(!f.is_pending(local));

    auto later = make_session(at(4000));
    f.store.write(later);
    f.remote.fail_fetches_after(0);
    auto result = f.coordinator->perform_sync();
    assert(throws<remote_exception>([&] { result.get(); }));
    assert(!f.is_pending(later));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_status_text
// ============================================================================

void test_status_text() {
    std::cout << "  test_status_text..." << std::flush;

    sync_status s;
    assert(s.status_text(at(0)) == "Not synced");

    s.last_sync_at = at(0);
    assert(s.status_text(at(42000)) == "Last synced 42s ago");
    assert(s.status_text(at(5 * 60000)) == "Last synced 5m ago");
    assert(s.status_text(at(3 * 3600000)) == "Last synced 3h ago");
    assert(s.status_text(at(int64_t(2) * 86400000)) == "Last synced 2d ago");

    s.last_error = "network unreachable";
    assert(s.status_text(at(1000)) == "Sync failed: network unreachable");

    s.is_syncing = true;
    assert(s.status_text(at(1000)) == "Syncing...");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all sync tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Sync Coordinator Tests ---" << std::endl;

    test_push_then_pull_newer_remote();
    test_pending_local_survives_pull();
    test_rejected_record_is_permanent();
    test_parents_pushed_first();
    test_children_deferred_behind_failed_parent();
    test_single_push_in_flight();
    test_pull_pagination_and_cursor();
    test_pull_survives_edit_between_pages();
    test_auth_refresh();
    test_cancel();
    test_switch_account();
    test_switch_account_during_push();
    test_invalid_config_rejected();
    test_perform_sync();
    test_status_text();

    std::cout << "--- Sync Coordinator Tests: All passed ---" << std::endl;
}

} // namespace sync_tests
