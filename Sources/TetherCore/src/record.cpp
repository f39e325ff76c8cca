#include "tether/record.hpp"
#include "tether/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tether {

using json = nlohmann::json;

// ============================================================================
// Entity registry
// ============================================================================

namespace {

std::vector<entity_schema> build_schemas() {
    std::vector<field_def> impact_fields = {
        {"climbId", "climb_id", field_kind::text, entity_type::climb},
        {"tagId", "tag_id", field_kind::text, std::nullopt},
        {"impact", "impact", field_kind::text, std::nullopt},
    };
    std::vector<std::string> impact_unique = {columns::owner_id, "climbId", "tagId"};

    return {
        {entity_type::session, "session", "Session", "sessions", {
            {"discipline", "discipline", field_kind::text, std::nullopt},
            {"startedAt", "started_at", field_kind::timestamp, std::nullopt},
            {"endedAt", "ended_at", field_kind::timestamp, std::nullopt},
            {"mentalReadiness", "mental_readiness", field_kind::integer, std::nullopt},
            {"physicalReadiness", "physical_readiness", field_kind::integer, std::nullopt},
            {"rpe", "rpe", field_kind::integer, std::nullopt},
            {"pumpLevel", "pump_level", field_kind::integer, std::nullopt},
            {"notes", "notes", field_kind::text, std::nullopt},
            {"isPrivate", "is_private", field_kind::boolean, std::nullopt},
        }, {}},
        {entity_type::climb, "climb", "Climb", "climbs", {
            {"sessionId", "session_id", field_kind::text, entity_type::session},
            {"discipline", "discipline", field_kind::text, std::nullopt},
            {"isOutdoor", "is_outdoor", field_kind::boolean, std::nullopt},
            {"name", "name", field_kind::text, std::nullopt},
            {"gradeOriginal", "grade_original", field_kind::text, std::nullopt},
            {"gradeScale", "grade_scale", field_kind::text, std::nullopt},
            {"gradeScoreMin", "grade_score_min", field_kind::integer, std::nullopt},
            {"gradeScoreMax", "grade_score_max", field_kind::integer, std::nullopt},
            {"openBetaClimbId", "open_beta_climb_id", field_kind::text, std::nullopt},
            {"openBetaAreaId", "open_beta_area_id", field_kind::text, std::nullopt},
            {"locationDisplay", "location_display", field_kind::text, std::nullopt},
            {"belayPartnerUserId", "belay_partner_user_id", field_kind::text, std::nullopt},
            {"belayPartnerName", "belay_partner_name", field_kind::text, std::nullopt},
            {"notes", "notes", field_kind::text, std::nullopt},
        }, {}},
        {entity_type::attempt, "attempt", "Attempt", "attempts", {
            {"sessionId", "session_id", field_kind::text, entity_type::session},
            {"climbId", "climb_id", field_kind::text, entity_type::climb},
            {"attemptNumber", "attempt_number", field_kind::integer, std::nullopt},
            {"outcome", "outcome", field_kind::text, std::nullopt},
            {"sendType", "send_type", field_kind::text, std::nullopt},
            {"occurredAt", "occurred_at", field_kind::timestamp, std::nullopt},
        }, {"climbId", "attemptNumber"}},
        {entity_type::technique_impact, "technique_impact", "TechniqueImpact", "technique_impacts",
            impact_fields, impact_unique},
        {entity_type::skill_impact, "skill_impact", "SkillImpact", "skill_impacts",
            impact_fields, impact_unique},
        {entity_type::wall_style_impact, "wall_style_impact", "WallStyleImpact", "wall_style_impacts",
            impact_fields, impact_unique},
    };
}

const std::vector<entity_schema>& all_schemas() {
    static const std::vector<entity_schema> schemas = build_schemas();
    return schemas;
}

} // namespace

const field_def* entity_schema::field(const std::string& field_name) const {
    for (const auto& f : fields) {
        if (f.name == field_name) return &f;
    }
    return nullptr;
}

const entity_schema& schema_for(entity_type type) {
    return all_schemas().at(static_cast<size_t>(type));
}

std::string to_string(entity_type type) {
    return schema_for(type).name;
}

std::optional<entity_type> entity_type_from_string(const std::string& name) {
    for (const auto& schema : all_schemas()) {
        if (schema.name == name) return schema.type;
    }
    return std::nullopt;
}

// ============================================================================
// record implementation
// ============================================================================

record record::create(entity_type type, const std::string& owner_id, timestamp_t now) {
    record r;
    r.type = type;
    r.id = uuid_t::generate().to_string();
    r.owner_id = owner_id;
    r.created_at = now;
    r.updated_at = now;
    r.pending_sync = true;
    for (const auto& f : schema_for(type).fields) {
        r.fields[f.name] = nullptr;
    }
    return r;
}

const column_value_t* record::get(const std::string& name) const {
    auto it = fields.find(name);
    if (it == fields.end()) return nullptr;
    return &it->second;
}

std::optional<std::string> record::get_text(const std::string& name) const {
    auto* v = get(name);
    if (v && std::holds_alternative<std::string>(*v)) {
        return std::get<std::string>(*v);
    }
    return std::nullopt;
}

std::optional<int64_t> record::get_integer(const std::string& name) const {
    auto* v = get(name);
    if (v && std::holds_alternative<int64_t>(*v)) {
        return std::get<int64_t>(*v);
    }
    return std::nullopt;
}

void record::set(const std::string& name, column_value_t value) {
    if (!schema_for(type).field(name)) {
        throw std::invalid_argument("Unknown field '" + name + "' for " + to_string(type));
    }
    fields[name] = std::move(value);
}

std::vector<std::pair<entity_type, std::string>> record::parent_refs() const {
    std::vector<std::pair<entity_type, std::string>> refs;
    for (const auto& f : schema_for(type).fields) {
        if (!f.references) continue;
        auto parent_id = get_text(f.name);
        if (parent_id && !parent_id->empty()) {
            refs.emplace_back(*f.references, *parent_id);
        }
    }
    return refs;
}

void mark_modified(record& r, timestamp_t now) {
    r.updated_at = std::max(now, r.updated_at + millis_t(1));
    r.pending_sync = true;
}

void mark_deleted(record& r, timestamp_t now) {
    mark_modified(r, now);
    r.deleted_at = r.updated_at;
}

// ============================================================================
// remote_snapshot implementation
// ============================================================================

remote_snapshot remote_snapshot::of(const record& r) {
    return {r.type, r.id, r.owner_id, r.created_at, r.updated_at, r.deleted_at, r.fields};
}

record remote_snapshot::to_record() const {
    record r;
    r.type = type;
    r.id = id;
    r.owner_id = owner_id;
    r.created_at = created_at;
    r.updated_at = updated_at;
    r.deleted_at = deleted_at;
    r.pending_sync = false;
    r.fields = fields;
    return r;
}

// ============================================================================
// JSON serialization helpers for field values
// ============================================================================

static json field_to_json(const field_def& def, const column_value_t& value) {
    if (detail::is_null(value)) {
        return nullptr;
    }

    switch (def.kind) {
        case field_kind::timestamp:
            if (std::holds_alternative<int64_t>(value)) {
                return format_iso8601(from_millis(std::get<int64_t>(value)));
            }
            break;
        case field_kind::boolean:
            if (std::holds_alternative<int64_t>(value)) {
                return std::get<int64_t>(value) != 0;
            }
            break;
        case field_kind::integer:
            if (std::holds_alternative<int64_t>(value)) {
                return std::get<int64_t>(value);
            }
            break;
        case field_kind::real:
            if (std::holds_alternative<double>(value)) {
                return std::get<double>(value);
            }
            if (std::holds_alternative<int64_t>(value)) {
                return static_cast<double>(std::get<int64_t>(value));
            }
            break;
        case field_kind::text:
            if (std::holds_alternative<std::string>(value)) {
                return std::get<std::string>(value);
            }
            break;
    }

    if (std::holds_alternative<std::vector<uint8_t>>(value)) {
        // Encode as hex string
        const auto& data = std::get<std::vector<uint8_t>>(value);
        std::ostringstream hex;
        for (auto byte : data) {
            hex << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte);
        }
        return hex.str();
    }

    LOG_WARN("record", "Field %s holds a value of the wrong type, sending null", def.wire_name.c_str());
    return nullptr;
}

static std::optional<column_value_t> json_to_field(const field_def& def, const json& j) {
    if (j.is_null()) {
        return column_value_t(nullptr);
    }

    switch (def.kind) {
        case field_kind::timestamp:
            if (j.is_string()) {
                auto ts = parse_iso8601(j.get<std::string>());
                if (ts) return column_value_t(to_millis(*ts));
            }
            return std::nullopt;
        case field_kind::boolean:
            if (j.is_boolean()) return column_value_t(static_cast<int64_t>(j.get<bool>() ? 1 : 0));
            if (j.is_number_integer()) return column_value_t(static_cast<int64_t>(j.get<int64_t>() != 0));
            return std::nullopt;
        case field_kind::integer:
            if (j.is_number_integer()) return column_value_t(j.get<int64_t>());
            if (j.is_number_float()) return column_value_t(static_cast<int64_t>(j.get<double>()));
            return std::nullopt;
        case field_kind::real:
            if (j.is_number()) return column_value_t(j.get<double>());
            return std::nullopt;
        case field_kind::text:
            if (j.is_string()) return column_value_t(j.get<std::string>());
            return std::nullopt;
    }
    return std::nullopt;
}

std::string remote_snapshot::to_json() const {
    json j;
    j["id"] = id;
    j["user_id"] = owner_id;
    j["created_at"] = format_iso8601(created_at);
    j["updated_at"] = format_iso8601(updated_at);
    j["deleted_at"] = deleted_at ? json(format_iso8601(*deleted_at)) : json(nullptr);

    for (const auto& def : schema_for(type).fields) {
        auto it = fields.find(def.name);
        j[def.wire_name] = field_to_json(def, it != fields.end() ? it->second : column_value_t(nullptr));
    }

    return j.dump();
}

std::optional<remote_snapshot> remote_snapshot::from_json(entity_type type, const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        LOG_WARN("record", "Unparseable %s row: %s", to_string(type).c_str(), e.what());
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    remote_snapshot snap;
    snap.type = type;

    if (!j.contains("id") || !j["id"].is_string()) return std::nullopt;
    snap.id = j["id"].get<std::string>();

    if (j.contains("user_id") && j["user_id"].is_string()) {
        snap.owner_id = j["user_id"].get<std::string>();
    }

    if (!j.contains("updated_at") || !j["updated_at"].is_string()) return std::nullopt;
    auto updated = parse_iso8601(j["updated_at"].get<std::string>());
    if (!updated) return std::nullopt;
    snap.updated_at = *updated;

    snap.created_at = snap.updated_at;
    if (j.contains("created_at") && j["created_at"].is_string()) {
        auto created = parse_iso8601(j["created_at"].get<std::string>());
        if (!created) return std::nullopt;
        snap.created_at = *created;
    }

    if (j.contains("deleted_at") && !j["deleted_at"].is_null()) {
        if (!j["deleted_at"].is_string()) return std::nullopt;
        auto deleted = parse_iso8601(j["deleted_at"].get<std::string>());
        if (!deleted) return std::nullopt;
        snap.deleted_at = *deleted;
    }

    for (const auto& def : schema_for(type).fields) {
        if (!j.contains(def.wire_name)) {
            snap.fields[def.name] = nullptr;
            continue;
        }
        auto value = json_to_field(def, j[def.wire_name]);
        if (!value) {
            LOG_WARN("record", "Field %s of %s %s has an unexpected JSON type",
                     def.wire_name.c_str(), to_string(type).c_str(), snap.id.c_str());
            return std::nullopt;
        }
        snap.fields[def.name] = std::move(*value);
    }

    return snap;
}

} // namespace tether
