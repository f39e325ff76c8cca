#include "tether/conflict_resolver.hpp"

namespace tether {

resolution conflict_resolver::resolve(const std::optional<record>& local, const remote_snapshot& remote) {
    if (!local) {
        return {remote.to_record(), merge_outcome::inserted_remote};
    }

    if (local->pending_sync) {
        return {*local, merge_outcome::kept_local_pending};
    }

    if (remote.updated_at > local->updated_at) {
        record merged = *local;
        merged.fields = remote.fields;
        merged.updated_at = remote.updated_at;
        merged.deleted_at = remote.deleted_at;
        merged.pending_sync = false;
        return {std::move(merged), merge_outcome::applied_remote};
    }

    return {*local, merge_outcome::kept_local_newer};
}

} // namespace tether
