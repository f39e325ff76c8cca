#include "tether/remote_client.hpp"
#include "tether/log.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>

namespace tether {

using json = nlohmann::json;

std::string to_string(error_kind kind) {
    switch (kind) {
        case error_kind::network_unreachable: return "network unreachable";
        case error_kind::timeout: return "timeout";
        case error_kind::server: return "server error";
        case error_kind::client: return "rejected";
        case error_kind::auth_expired: return "authentication expired";
        case error_kind::dependency_not_ready: return "dependency not ready";
    }
    return "unknown";
}

std::string remote_error::describe() const {
    std::string s = to_string(kind);
    if (status_code != 0) {
        s += " (" + std::to_string(status_code) + ")";
    }
    if (!message.empty()) {
        s += ": " + message;
    }
    return s;
}

namespace {

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

// PostgREST error bodies look like {"code":"23503","message":"..."}
std::pair<std::string, std::string> error_body(const std::string& body) {
    try {
        json j = json::parse(body);
        std::string code, message;
        if (j.is_object()) {
            if (j.contains("code") && j["code"].is_string()) code = j["code"].get<std::string>();
            if (j.contains("message") && j["message"].is_string()) message = j["message"].get<std::string>();
        }
        return {code, message};
    } catch (const json::parse_error&) {
        return {"", body};
    }
}

constexpr const char* foreign_key_violation = "23503";

// Key of a raw row, usable even when the rest of the row is malformed
std::optional<page_key> row_key(const json& row) {
    if (!row.is_object() || !row.contains("id") || !row["id"].is_string()) return std::nullopt;
    if (!row.contains("updated_at") || !row["updated_at"].is_string()) return std::nullopt;
    auto updated = parse_iso8601(row["updated_at"].get<std::string>());
    if (!updated) return std::nullopt;
    return page_key{*updated, row["id"].get<std::string>()};
}

} // namespace

// ============================================================================
// http_remote_client implementation
// ============================================================================

http_remote_client::http_remote_client(std::unique_ptr<http_client> http, auth_provider& auth,
                                       remote_config config)
    : http_(std::move(http))
    , auth_(auth)
    , config_(std::move(config)) {
    if (!http_) {
        throw std::invalid_argument("http_remote_client requires an http_client");
    }
}

http_remote_client::http_remote_client(auth_provider& auth, remote_config config)
    : http_remote_client(get_network_factory()->create_http_client(), auth, std::move(config)) {
}

remote_error http_remote_client::classify_response(const http_response& response) {
    auto [code, message] = error_body(response.body_string());
    int status = response.status_code;

    remote_error error{error_kind::client, status, message};
    if (status == 0) {
        error.kind = error_kind::network_unreachable;
    } else if (status == 408 || status == 504) {
        error.kind = error_kind::timeout;
    } else if (status == 401) {
        error.kind = error_kind::auth_expired;
    } else if (status == 409 || code == foreign_key_violation) {
        error.kind = error_kind::dependency_not_ready;
    } else if (status >= 500) {
        error.kind = error_kind::server;
    }
    return error;
}

http_request http_remote_client::make_request(const std::string& method,
                                              const std::string& path_and_query) {
    http_request request;
    request.method = method;
    request.url = config_.base_url + "/rest/v1/" + path_and_query;
    request.headers["apikey"] = config_.api_key;
    request.headers["Authorization"] = "Bearer " + auth_.access_token();
    request.headers["Accept"] = "application/json";
    return request;
}

upsert_result http_remote_client::upsert_one(entity_type type, const record& r) {
    const auto& schema = schema_for(type);

    auto request = make_request("POST", schema.remote_table + "?on_conflict=id&select=*");
    request.headers["Prefer"] = "resolution=merge-duplicates,return=representation";
    request.set_json_body("[" + remote_snapshot::of(r).to_json() + "]");

    auto response = http_->send(request);
    if (!response.is_success()) {
        auto error = classify_response(response);
        LOG_WARN("remote", "Upsert of %s %s failed: %s", schema.name.c_str(), r.id.c_str(),
                 error.describe().c_str());
        return {r.id, std::nullopt, std::move(error)};
    }

    upsert_result result{r.id, std::nullopt, std::nullopt};
    try {
        json rows = json::parse(response.body_string());
        if (rows.is_array() && !rows.empty()) {
            result.accepted = remote_snapshot::from_json(type, rows.front().dump());
        }
    } catch (const json::parse_error& e) {
        LOG_WARN("remote", "Upsert of %s %s returned an unreadable body: %s",
                 schema.name.c_str(), r.id.c_str(), e.what());
    }
    return result;
}

std::vector<upsert_result> http_remote_client::upsert(entity_type type,
                                                      const std::vector<record>& records) {
    std::vector<upsert_result> results;
    results.reserve(records.size());

    for (size_t i = 0; i < records.size(); ++i) {
        auto result = upsert_one(type, records[i]);
        bool offline = result.error && result.error->kind == error_kind::network_unreachable;
        results.push_back(std::move(result));

        if (offline) {
            // Remaining records would fail the same way
            auto error = *results.back().error;
            for (size_t j = i + 1; j < records.size(); ++j) {
                results.push_back({records[j].id, std::nullopt, error});
            }
            break;
        }
    }
    return results;
}

fetch_page http_remote_client::fetch_since(entity_type type, const fetch_request& request) {
    const auto& schema = schema_for(type);

    std::string query = schema.remote_table + "?select=*"
        + "&user_id=eq." + url_encode(request.owner_id)
        + "&updated_at=gt." + url_encode(format_iso8601(request.since))
        + "&order=updated_at.asc,id.asc"
        + "&limit=" + std::to_string(request.page_size);
    if (request.after) {
        // Strictly after the previous page's last (updated_at, id)
        auto after = url_encode(format_iso8601(request.after->updated_at));
        query += "&or=(updated_at.gt." + after
            + ",and(updated_at.eq." + after + ",id.gt." + url_encode(request.after->id) + "))";
    }

    auto response = http_->send(make_request("GET", query));
    if (!response.is_success()) {
        throw remote_exception(classify_response(response));
    }

    json rows;
    try {
        rows = json::parse(response.body_string());
    } catch (const json::parse_error& e) {
        throw remote_exception({error_kind::server, response.status_code,
                                std::string("Unreadable page: ") + e.what()});
    }
    if (!rows.is_array()) {
        throw remote_exception({error_kind::server, response.status_code, "Page is not a JSON array"});
    }

    fetch_page page;
    page.has_more = rows.size() == request.page_size;
    page.records.reserve(rows.size());
    for (const auto& row : rows) {
        if (auto key = row_key(row)) page.last = std::move(key);
        auto snapshot = remote_snapshot::from_json(type, row.dump());
        if (!snapshot) {
            LOG_WARN("remote", "Skipping malformed %s row", schema.name.c_str());
            continue;
        }
        page.records.push_back(std::move(*snapshot));
    }

    LOG_DEBUG("remote", "Fetched %zu %s row(s)%s", page.records.size(),
              schema.name.c_str(), request.after ? " after continuation" : "");
    return page;
}

} // namespace tether
