#include "tether/change_tracker.hpp"

namespace tether {

std::vector<record> change_tracker::pending_records(entity_type type,
                                                    const std::string& owner_id) const {
    record_query q;
    q.type = type;
    q.owner_id = owner_id;
    q.pending_only = true;
    q.include_deleted = true;
    return store_.query(q);
}

size_t change_tracker::pending_count(const std::string& owner_id) const {
    size_t total = 0;
    for (auto type : dependency_order) {
        record_query q;
        q.type = type;
        q.owner_id = owner_id;
        q.pending_only = true;
        q.include_deleted = true;
        total += store_.count(q);
    }
    return total;
}

bool change_tracker::mark_in_flight(const std::string& record_id) {
    return in_flight_.insert(record_id).second;
}

void change_tracker::clear_in_flight(const std::string& record_id) {
    in_flight_.erase(record_id);
}

bool change_tracker::is_in_flight(const std::string& record_id) const {
    return in_flight_.count(record_id) > 0;
}

} // namespace tether
