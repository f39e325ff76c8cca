#include "tether/local_store.hpp"
#include "tether/log.hpp"
#include <sstream>

namespace tether {

namespace {

column_type column_type_for(field_kind kind) {
    switch (kind) {
        case field_kind::real: return column_type::real;
        case field_kind::text: return column_type::text;
        case field_kind::integer:
        case field_kind::boolean:
        case field_kind::timestamp:
            return column_type::integer;
    }
    return column_type::text;
}

constexpr const char* cursor_table = "_SyncCursor";

std::vector<std::pair<std::string, column_value_t>> row_values(const record& r) {
    std::vector<std::pair<std::string, column_value_t>> values = {
        {columns::record_id, r.id},
        {columns::owner_id, r.owner_id},
        {columns::created_at, to_millis(r.created_at)},
        {columns::updated_at, to_millis(r.updated_at)},
        {columns::deleted_at, detail::to_column_value(r.deleted_at)},
        {columns::pending_sync, detail::to_column_value(r.pending_sync)},
    };
    for (const auto& f : schema_for(r.type).fields) {
        auto* v = r.get(f.name);
        values.emplace_back(f.name, v ? *v : column_value_t(nullptr));
    }
    return values;
}

int64_t int_column(const database::row_t& row, const char* name) {
    auto it = row.find(name);
    if (it == row.end() || !std::holds_alternative<int64_t>(it->second)) {
        throw db_error(std::string("Column ") + name + " is missing or not an integer");
    }
    return std::get<int64_t>(it->second);
}

std::string text_column(const database::row_t& row, const char* name) {
    auto it = row.find(name);
    if (it == row.end() || !std::holds_alternative<std::string>(it->second)) {
        throw db_error(std::string("Column ") + name + " is missing or not text");
    }
    return std::get<std::string>(it->second);
}

record record_from_row(entity_type type, const database::row_t& row) {
    record r;
    r.type = type;
    r.id = text_column(row, columns::record_id);
    r.owner_id = text_column(row, columns::owner_id);
    r.created_at = from_millis(int_column(row, columns::created_at));
    r.updated_at = from_millis(int_column(row, columns::updated_at));
    auto deleted = row.find(columns::deleted_at);
    if (deleted != row.end() && std::holds_alternative<int64_t>(deleted->second)) {
        r.deleted_at = from_millis(std::get<int64_t>(deleted->second));
    }
    r.pending_sync = int_column(row, columns::pending_sync) != 0;

    for (const auto& f : schema_for(type).fields) {
        auto it = row.find(f.name);
        r.fields[f.name] = it != row.end() ? it->second : column_value_t(nullptr);
    }
    return r;
}

} // namespace

// ============================================================================
// local_store
// ============================================================================

local_store::local_store(SharedScheduler observer_scheduler)
    : observer_scheduler_(observer_scheduler ? std::move(observer_scheduler)
                                             : std::make_shared<immediate_scheduler>()) {
}

void local_store::write(const record& r) {
    auto txn = begin();
    if (!txn->update(r)) {
        txn->insert(r);
    }
    txn->save();
}

local_store::observer_id local_store::add_table_observer(entity_type type, change_observer callback) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto id = next_observer_id_++;
    table_observers_[type][id] = std::move(callback);
    return id;
}

void local_store::remove_table_observer(entity_type type, observer_id id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto it = table_observers_.find(type);
    if (it != table_observers_.end()) {
        it->second.erase(id);
    }
}

void local_store::notify_change(entity_type type, const std::string& operation,
                                const std::string& record_id) {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        auto it = table_observers_.find(type);
        if (it != table_observers_.end()) {
            for (const auto& [id, cb] : it->second) {
                callbacks.push_back([cb, operation, record_id] {
                    cb(operation, record_id);
                });
            }
        }
    }

    for (auto& cb : callbacks) {
        observer_scheduler_->invoke(std::move(cb));
    }
}

// ============================================================================
// sqlite_store_transaction
// ============================================================================

class sqlite_store_transaction : public store_transaction {
public:
    explicit sqlite_store_transaction(sqlite_local_store& store)
        : store_(store)
        , lock_(store.mutex_)
        , txn_(store.db_) {
    }

    void insert(const record& r) override {
        store_.insert_row(r);
        changes_.push_back({r.type, "INSERT", r.id});
    }

    bool update(const record& r) override {
        if (!store_.update_row(r)) return false;
        changes_.push_back({r.type, "UPDATE", r.id});
        return true;
    }

    std::optional<record> find(entity_type type, const std::string& id) override {
        return store_.find(type, id);
    }

    std::vector<record> query(const record_query& q) override {
        return store_.select(q);
    }

    void save() override {
        txn_.commit();
        lock_.unlock();

        LOG_DEBUG("store", "Saved %zu change(s)", changes_.size());
        for (const auto& c : changes_) {
            store_.notify_change(c.type, c.operation, c.record_id);
        }
        changes_.clear();
    }

private:
    struct change {
        entity_type type;
        std::string operation;
        std::string record_id;
    };

    sqlite_local_store& store_;
    std::unique_lock<std::recursive_mutex> lock_;
    transaction txn_;
    std::vector<change> changes_;
};

// ============================================================================
// sqlite_local_store
// ============================================================================

sqlite_local_store::sqlite_local_store(const store_config& config, SharedScheduler observer_scheduler)
    : local_store(std::move(observer_scheduler))
    , db_(config.path) {
    for (auto type : dependency_order) {
        db_.ensure_table(table_for(type));
    }
    db_.ensure_table({cursor_table, {
        {"id", column_type::integer, false, true},
        {"accountId", column_type::text, false, false, true},
        {"cursor", column_type::integer, false},
    }, {}});
    LOG_INFO("store", "Opened local store at %s", config.path.c_str());
}

table_schema sqlite_local_store::table_for(entity_type type) {
    const auto& schema = schema_for(type);

    table_schema table;
    table.name = schema.table_name;
    table.columns = {
        {columns::row_id, column_type::integer, false, true},
        {columns::record_id, column_type::text, false, false, true},
        {columns::owner_id, column_type::text, false},
        {columns::created_at, column_type::integer, false},
        {columns::updated_at, column_type::integer, false},
        {columns::deleted_at, column_type::integer, true},
        {columns::pending_sync, column_type::integer, false},
    };
    for (const auto& f : schema.fields) {
        table.columns.push_back({f.name, column_type_for(f.kind), true});
    }

    table.indexes.push_back({"idx_" + schema.table_name + "_owner_pending",
                             {columns::owner_id, columns::pending_sync}, false, ""});
    if (!schema.unique_active.empty()) {
        table.indexes.push_back({"uq_" + schema.table_name + "_active",
                                 schema.unique_active, true,
                                 std::string(columns::deleted_at) + " IS NULL"});
    }
    return table;
}

std::unique_ptr<store_transaction> sqlite_local_store::begin() {
    return std::make_unique<sqlite_store_transaction>(*this);
}

std::optional<record> sqlite_local_store::find(entity_type type, const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rows = db_.query("SELECT * FROM " + schema_for(type).table_name +
                          " WHERE " + columns::record_id + " = ?", {id});
    if (rows.empty()) return std::nullopt;
    return record_from_row(type, rows.front());
}

std::vector<record> sqlite_local_store::query(const record_query& q) {
    return select(q);
}

size_t sqlite_local_store::count(const record_query& q) {
    return select(q).size();
}

std::vector<record> sqlite_local_store::select(const record_query& q) {
    std::ostringstream sql;
    std::vector<column_value_t> params;

    sql << "SELECT * FROM " << schema_for(q.type).table_name << " WHERE 1 = 1";
    if (q.owner_id) {
        sql << " AND " << columns::owner_id << " = ?";
        params.emplace_back(*q.owner_id);
    }
    if (q.pending_only) {
        sql << " AND " << columns::pending_sync << " = 1";
    }
    if (!q.include_deleted) {
        sql << " AND " << columns::deleted_at << " IS NULL";
    }
    if (!q.ids.empty()) {
        sql << " AND " << columns::record_id << " IN (";
        for (size_t i = 0; i < q.ids.size(); ++i) {
            sql << (i > 0 ? ", ?" : "?");
            params.emplace_back(q.ids[i]);
        }
        sql << ")";
    }
    sql << " ORDER BY " << columns::row_id;

    std::vector<database::row_t> rows;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        rows = db_.query(sql.str(), params);
    }

    std::vector<record> results;
    results.reserve(rows.size());
    for (const auto& row : rows) {
        auto r = record_from_row(q.type, row);
        if (q.where && !q.where(r)) continue;
        results.push_back(std::move(r));
    }
    return results;
}

void sqlite_local_store::insert_row(const record& r) {
    db_.insert(schema_for(r.type).table_name, row_values(r));
}

bool sqlite_local_store::update_row(const record& r) {
    auto values = row_values(r);
    // The id is the key, not a column to overwrite
    values.erase(values.begin());
    return db_.update(schema_for(r.type).table_name, columns::record_id, r.id, values) > 0;
}

timestamp_t sqlite_local_store::load_cursor(const std::string& account_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rows = db_.query(std::string("SELECT cursor FROM ") + cursor_table + " WHERE accountId = ?",
                          {account_id});
    if (rows.empty()) return epoch();
    return from_millis(int_column(rows.front(), "cursor"));
}

void sqlite_local_store::store_cursor(const std::string& account_id, timestamp_t cursor) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    db_.insert(cursor_table, {{"accountId", account_id}, {"cursor", to_millis(cursor)}},
               {"accountId"});
    LOG_DEBUG("store", "Cursor for %s is now %s", account_id.c_str(), format_iso8601(cursor).c_str());
}

} // namespace tether
