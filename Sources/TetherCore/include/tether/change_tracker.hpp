#pragma once

#ifdef __cplusplus

#include "local_store.hpp"
#include "record.hpp"
#include <set>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// ChangeTracker - pending-record scan and in-flight dedup
// ============================================================================
//
// pending_records() and pending_count() only read the store and may run on any
// thread. The in-flight set is plain memory owned by the sync coordinator's
// mailbox and must only be touched from there.

class change_tracker {
public:
    explicit change_tracker(local_store& store) : store_(store) {}

    /// Every record of the type with pending_sync set, soft-deleted ones
    /// included.
    std::vector<record> pending_records(entity_type type, const std::string& owner_id) const;

    /// Pending records across all entity types.
    size_t pending_count(const std::string& owner_id) const;

    /// Returns false if the record is already in flight.
    bool mark_in_flight(const std::string& record_id);
    void clear_in_flight(const std::string& record_id);
    bool is_in_flight(const std::string& record_id) const;
    size_t in_flight_count() const { return in_flight_.size(); }

private:
    local_store& store_;
    std::set<std::string> in_flight_;
};

} // namespace tether

#endif // __cplusplus
