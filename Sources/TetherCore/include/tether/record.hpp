#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tether {

// ============================================================================
// Entity types and their fixed dependency order
// ============================================================================

enum class entity_type : int {
    session = 0,
    climb = 1,
    attempt = 2,
    technique_impact = 3,
    skill_impact = 4,
    wall_style_impact = 5
};

/// Parents strictly before children. A push cycle walks this list in order,
/// so a child's foreign keys are satisfiable on the remote by the time the
/// child is sent.
inline constexpr std::array<entity_type, 6> dependency_order = {
    entity_type::session,
    entity_type::climb,
    entity_type::attempt,
    entity_type::technique_impact,
    entity_type::skill_impact,
    entity_type::wall_style_impact
};

std::string to_string(entity_type type);
std::optional<entity_type> entity_type_from_string(const std::string& name);

// ============================================================================
// Entity schema (Record <-> local row <-> wire DTO mapping)
// ============================================================================

enum class field_kind {
    integer,
    real,
    text,
    boolean,    // INTEGER 0/1 locally, JSON bool on the wire
    timestamp   // INTEGER millis locally, ISO-8601 string on the wire
};

struct field_def {
    std::string name;        // local column (camelCase)
    std::string wire_name;   // remote column (snake_case)
    field_kind kind = field_kind::text;
    std::optional<entity_type> references;  // foreign key to a parent entity
};

struct entity_schema {
    entity_type type;
    std::string name;          // "session"
    std::string table_name;    // local table, "Session"
    std::string remote_table;  // remote table, "sessions"
    std::vector<field_def> fields;

    /// Columns that must be unique among rows with deletedAt IS NULL.
    /// Soft-deleted rows never take part, so a record can be re-created
    /// after its predecessor was deleted.
    std::vector<std::string> unique_active;

    const field_def* field(const std::string& name) const;
};

const entity_schema& schema_for(entity_type type);

// Columns present on every synced row
namespace columns {
    inline constexpr const char* row_id = "id";
    inline constexpr const char* record_id = "globalId";
    inline constexpr const char* owner_id = "ownerId";
    inline constexpr const char* created_at = "createdAt";
    inline constexpr const char* updated_at = "updatedAt";
    inline constexpr const char* deleted_at = "deletedAt";
    inline constexpr const char* pending_sync = "pendingSync";
}

using field_map = std::map<std::string, column_value_t>;

// ============================================================================
// Record - the unit of sync
// ============================================================================

struct record {
    entity_type type = entity_type::session;
    std::string id;
    std::string owner_id;
    timestamp_t created_at{};
    timestamp_t updated_at{};
    std::optional<timestamp_t> deleted_at;
    bool pending_sync = false;
    field_map fields;

    /// New record with a client-generated id, pending its first push. Every
    /// entity field starts out null.
    static record create(entity_type type, const std::string& owner_id,
                         timestamp_t now = now_millis());

    bool is_deleted() const { return deleted_at.has_value(); }

    /// Entity field lookup. Returns nullptr for unknown or unset fields.
    const column_value_t* get(const std::string& name) const;
    std::optional<std::string> get_text(const std::string& name) const;
    std::optional<int64_t> get_integer(const std::string& name) const;

    /// Raw field write. Does not touch updated_at or pending_sync; use
    /// mark_modified() once the edit is complete.
    void set(const std::string& name, column_value_t value);

    /// (parent type, parent id) for every non-null foreign key field.
    std::vector<std::pair<entity_type, std::string>> parent_refs() const;

    bool operator==(const record& other) const = default;
};

/// Stamps a local mutation: updated_at = max(now, updated_at + 1ms) and the
/// record becomes pending.
void mark_modified(record& r, timestamp_t now = now_millis());

/// Soft delete. The row stays in storage so the deletion itself can sync.
void mark_deleted(record& r, timestamp_t now = now_millis());

// ============================================================================
// RemoteSnapshot - a record as the remote store reports it
// ============================================================================

struct remote_snapshot {
    entity_type type = entity_type::session;
    std::string id;
    std::string owner_id;
    timestamp_t created_at{};
    timestamp_t updated_at{};
    std::optional<timestamp_t> deleted_at;
    field_map fields;

    static remote_snapshot of(const record& r);

    /// Confirmed local copy (pending_sync = false)
    record to_record() const;

    // Serialize to the remote's JSON row shape (wire names, ISO-8601 dates)
    std::string to_json() const;

    // Deserialize one JSON row. Returns nullopt when the row is missing its
    // identity or timestamps or a field has the wrong JSON type.
    static std::optional<remote_snapshot> from_json(entity_type type, const std::string& json);

    bool operator==(const remote_snapshot& other) const = default;
};

} // namespace tether

#endif // __cplusplus
