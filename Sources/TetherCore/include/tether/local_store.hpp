#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "db.hpp"
#include "record.hpp"
#include "scheduler.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// Record query
// ============================================================================

struct record_query {
    entity_type type = entity_type::session;
    std::optional<std::string> owner_id;
    bool pending_only = false;
    bool include_deleted = false;       // user-facing reads leave this false
    std::vector<std::string> ids;       // restrict to these record ids if non-empty

    /// Applied in memory after the SQL filter
    std::function<bool(const record&)> where;
};

// ============================================================================
// Store transaction - all-or-nothing unit of work
// ============================================================================
//
// Nothing is visible to other readers until save() returns. Destroying a
// transaction that was not saved rolls it back.

class store_transaction {
public:
    virtual ~store_transaction() = default;

    /// Throws db_error if the id or an active-unique key is already taken.
    virtual void insert(const record& r) = 0;

    /// Overwrites every column of the stored row with the same id.
    /// Returns false if no such row exists.
    virtual bool update(const record& r) = 0;

    virtual std::optional<record> find(entity_type type, const std::string& id) = 0;
    virtual std::vector<record> query(const record_query& q) = 0;

    /// Commit. Throws db_error; on failure nothing was applied.
    virtual void save() = 0;
};

// ============================================================================
// Local store interface
// ============================================================================

class local_store {
public:
    using observer_id = uint64_t;
    using change_observer = std::function<void(const std::string& operation,
                                               const std::string& record_id)>;

    explicit local_store(SharedScheduler observer_scheduler = nullptr);
    virtual ~local_store() = default;

    local_store(const local_store&) = delete;
    local_store& operator=(const local_store&) = delete;

    virtual std::unique_ptr<store_transaction> begin() = 0;

    virtual std::optional<record> find(entity_type type, const std::string& id) = 0;
    virtual std::vector<record> query(const record_query& q) = 0;
    virtual size_t count(const record_query& q) = 0;

    /// Pull boundary for an account; epoch() if it never synced.
    virtual timestamp_t load_cursor(const std::string& account_id) = 0;
    virtual void store_cursor(const std::string& account_id, timestamp_t cursor) = 0;

    /// Insert-or-update in its own transaction. This is the user write path.
    void write(const record& r);

    // Register a table observer - called after a save() that touched the table
    observer_id add_table_observer(entity_type type, change_observer callback);
    void remove_table_observer(entity_type type, observer_id id);

protected:
    void notify_change(entity_type type, const std::string& operation,
                       const std::string& record_id);

private:
    SharedScheduler observer_scheduler_;
    std::mutex observers_mutex_;
    std::map<entity_type, std::map<observer_id, change_observer>> table_observers_;
    observer_id next_observer_id_ = 1;
};

// ============================================================================
// SQLite local store
// ============================================================================

class sqlite_local_store : public local_store {
public:
    explicit sqlite_local_store(const store_config& config = {},
                                SharedScheduler observer_scheduler = nullptr);

    std::unique_ptr<store_transaction> begin() override;

    std::optional<record> find(entity_type type, const std::string& id) override;
    std::vector<record> query(const record_query& q) override;
    size_t count(const record_query& q) override;

    timestamp_t load_cursor(const std::string& account_id) override;
    void store_cursor(const std::string& account_id, timestamp_t cursor) override;

    /// Table layout for an entity type
    static table_schema table_for(entity_type type);

    database& db() { return db_; }

private:
    friend class sqlite_store_transaction;

    database db_;
    // One connection; held for the whole lifetime of a store_transaction.
    std::recursive_mutex mutex_;

    std::vector<record> select(const record_query& q);
    void insert_row(const record& r);
    bool update_row(const record& r);
};

} // namespace tether

#endif // __cplusplus
