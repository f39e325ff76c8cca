#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>

namespace store_tests {

using namespace tether;
using namespace test_support;

// ============================================================================
// test_store_crud - insert, find, update, user-facing query
// ============================================================================

void test_store_crud() {
    std::cout << "  test_store_crud..." << std::flush;

    sqlite_local_store store;
    auto session = make_session(at(1000));
    session.set("notes", std::string("felt strong"));
    session.set("rpe", int64_t(8));

    auto txn = store.begin();
    txn->insert(session);
    assert(txn->find(entity_type::session, session.id));
    txn->save();

    auto found = store.find(entity_type::session, session.id);
    assert(found);
    assert(*found == session);

    found->set("notes", std::string("felt weak"));
    mark_modified(*found, at(2000));
    store.write(*found);
    assert(store.find(entity_type::session, session.id)->get_text("notes") == "felt weak");
    assert(store.find(entity_type::session, session.id)->updated_at == at(2000));

    // Other owners and soft-deleted rows are filtered
    store.write(make_session(at(1000), kOtherOwner));
    auto deleted = make_session(at(1000));
    mark_deleted(deleted, at(1500));
    store.write(deleted);

    record_query q;
    q.type = entity_type::session;
    q.owner_id = kOwner;
    assert(store.count(q) == 1);

    q.include_deleted = true;
    assert(store.count(q) == 2);

    q.where = [](const record& r) { return r.get_integer("rpe") == 8; };
    assert(store.query(q).size() == 1);

    q = {};
    q.type = entity_type::session;
    q.ids = {session.id, deleted.id};
    q.include_deleted = true;
    assert(store.count(q) == 2);

    assert(!store.find(entity_type::climb, session.id));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_store_rollback - unsaved and failed transactions leave no trace
// ============================================================================

void test_store_rollback() {
    std::cout << "  test_store_rollback..." << std::flush;

    sqlite_local_store store;
    auto a = make_session(at(1000));
    auto b = make_session(at(1000));

    {
        auto txn = store.begin();
        txn->insert(a);
        // Destroyed without save()
    }
    assert(!store.find(entity_type::session, a.id));

    store.write(a);

    // Second insert of the same id fails; the first write of the
    // transaction must not survive either
    bool threw = false;
    try {
        auto txn = store.begin();
        txn->insert(b);
        txn->insert(a);
        txn->save();
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);
    assert(!store.find(entity_type::session, b.id));
    assert(store.find(entity_type::session, a.id));

    // update() of a missing row reports it
    auto txn = store.begin();
    assert(!txn->update(b));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_active_uniqueness - soft-deleted rows do not block re-creation
// ============================================================================

void test_active_uniqueness() {
    std::cout << "  test_active_uniqueness..." << std::flush;

    sqlite_local_store store;
    auto session = make_session(at(1000));
    auto climb = make_climb(session, at(1000));
    store.write(session);
    store.write(climb);

    auto first = make_attempt(climb, 1, at(1000));
    store.write(first);

    // Same (climbId, attemptNumber) while the first is active
    bool threw = false;
    try {
        store.write(make_attempt(climb, 1, at(1100)));
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);

    // Soft delete, then re-create
    mark_deleted(first, at(1200));
    store.write(first);
    auto again = make_attempt(climb, 1, at(1300));
    store.write(again);

    record_query q;
    q.type = entity_type::attempt;
    assert(store.count(q) == 1);
    q.include_deleted = true;
    assert(store.count(q) == 2);

    // Impacts are unique per (owner, climb, tag)
    auto impact = record::create(entity_type::technique_impact, kOwner, at(1000));
    impact.set("climbId", climb.id);
    impact.set("tagId", std::string("heel-hook"));
    impact.set("impact", std::string("helped"));
    store.write(impact);

    auto other_owner = impact;
    other_owner.id = uuid_t::generate().to_string();
    other_owner.owner_id = kOtherOwner;
    store.write(other_owner);

    auto duplicate = impact;
    duplicate.id = uuid_t::generate().to_string();
    threw = false;
    try {
        store.write(duplicate);
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_cursor_persistence - per-account cursors, file-backed store
// ============================================================================

void test_cursor_persistence() {
    std::cout << "  test_cursor_persistence..." << std::flush;

    auto path = (std::filesystem::temp_directory_path() / "tether_cursor_test.db").string();
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");

    auto session = make_session(at(1000));
    {
        sqlite_local_store store(store_config{path});
        assert(store.load_cursor(kOwner) == epoch());
        store.store_cursor(kOwner, at(5000));
        store.store_cursor(kOwner, at(7000));
        store.store_cursor(kOtherOwner, at(100));
        store.write(session);
    }
    {
        sqlite_local_store store(store_config{path});
        assert(store.load_cursor(kOwner) == at(7000));
        assert(store.load_cursor(kOtherOwner) == at(100));
        auto found = store.find(entity_type::session, session.id);
        assert(found && found->pending_sync);
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_store_observers - notified after save, through the scheduler
// ============================================================================

void test_store_observers() {
    std::cout << "  test_store_observers..." << std::flush;

    auto main_thread = std::make_shared<queued_scheduler>();
    sqlite_local_store store({}, main_thread);

    std::vector<std::pair<std::string, std::string>> seen;
    auto id = store.add_table_observer(entity_type::session,
        [&](const std::string& operation, const std::string& record_id) {
            seen.emplace_back(operation, record_id);
        });

    auto session = make_session(at(1000));
    {
        auto txn = store.begin();
        txn->insert(session);
        // Not yet saved, nothing queued
        assert(main_thread->run_pending() == 0);
        txn->save();
    }
    // Climbs have no observer
    store.write(make_climb(session, at(1000)));

    assert(seen.empty());
    assert(main_thread->run_pending() == 1);
    assert(seen.size() == 1);
    assert(seen[0].first == "INSERT" && seen[0].second == session.id);

    mark_modified(session, at(2000));
    store.write(session);
    main_thread->run_pending();
    assert(seen.size() == 2 && seen[1].first == "UPDATE");

    // Rolled back writes are not announced
    {
        auto txn = store.begin();
        txn->update(session);
    }
    assert(main_thread->run_pending() == 0);

    store.remove_table_observer(entity_type::session, id);
    store.write(session);
    assert(main_thread->run_pending() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all store tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Local Store Tests ---" << std::endl;

    test_store_crud();
    test_store_rollback();
    test_active_uniqueness();
    test_cursor_persistence();
    test_store_observers();

    std::cout << "--- Local Store Tests: All passed ---" << std::endl;
}

} // namespace store_tests
