#pragma once

#ifdef __cplusplus

#include "record.hpp"
#include <optional>

namespace tether {

enum class merge_outcome {
    inserted_remote,     // no local copy existed
    kept_local_pending,  // local has unpushed changes
    applied_remote,      // remote was strictly newer
    kept_local_newer     // local is as new or newer; nothing to do
};

struct resolution {
    record result;
    merge_outcome outcome;

    /// True if the store must be written
    bool changed() const {
        return outcome == merge_outcome::inserted_remote || outcome == merge_outcome::applied_remote;
    }
};

// ============================================================================
// ConflictResolver - whole-record last-write-wins, pending local always wins
// ============================================================================

class conflict_resolver {
public:
    static resolution resolve(const std::optional<record>& local, const remote_snapshot& remote);
};

} // namespace tether

#endif // __cplusplus
