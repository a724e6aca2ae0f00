#include "capsync/protocol.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include <iomanip>
#include <sstream>

namespace capsync {

using json = nlohmann::json;

// ============================================================================
// Tagged column values
// ============================================================================

std::string to_hex(const byte_vector& data) {
    std::ostringstream hex;
    for (auto byte : data) {
        hex << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte);
    }
    return hex.str();
}

byte_vector from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd-length hex string");
    }
    byte_vector data;
    data.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        size_t used = 0;
        int byte = std::stoi(hex.substr(i, 2), &used, 16);
        if (used != 2) {
            throw std::invalid_argument("invalid hex digit");
        }
        data.push_back(static_cast<uint8_t>(byte));
    }
    return data;
}

json value_to_json(const column_value_t& value) {
    json j;
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            j["kind"] = static_cast<int>(value_kind::null_kind);
            j["value"] = nullptr;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            j["kind"] = static_cast<int>(value_kind::int64_kind);
            j["value"] = v;
        } else if constexpr (std::is_same_v<T, double>) {
            j["kind"] = static_cast<int>(value_kind::double_kind);
            j["value"] = v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            j["kind"] = static_cast<int>(value_kind::string_kind);
            j["value"] = v;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            j["kind"] = static_cast<int>(value_kind::data_kind);
            j["value"] = to_hex(v);
        }
    }, value);
    return j;
}

column_value_t value_from_json(const json& j) {
    if (j.is_object() && j.contains("kind")) {
        auto kind = static_cast<value_kind>(j["kind"].get<int>());

        if (kind == value_kind::null_kind || !j.contains("value") || j["value"].is_null()) {
            return nullptr;
        }

        const auto& v = j["value"];
        switch (kind) {
            case value_kind::int64_kind:
                return v.get<int64_t>();
            case value_kind::double_kind:
                return v.get<double>();
            case value_kind::string_kind:
                return v.get<std::string>();
            case value_kind::data_kind:
                return from_hex(v.get<std::string>());
            case value_kind::null_kind:
                return nullptr;
        }
        throw std::invalid_argument("unknown value kind " + std::to_string(static_cast<int>(kind)));
    }

    // Raw scalars
    if (j.is_null()) {
        return nullptr;
    } else if (j.is_string()) {
        return j.get<std::string>();
    } else if (j.is_number_integer()) {
        return j.get<int64_t>();
    } else if (j.is_number_float()) {
        return j.get<double>();
    } else if (j.is_boolean()) {
        return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
    }
    throw std::invalid_argument("unsupported value " + j.dump());
}

// Matches SQLite's json_quote() for the key types tracked tables use.
std::string encode_primary_key(const column_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            throw query_error("BLOB primary keys are not supported");
        } else {
            return json(v).dump();
        }
    }, value);
}

column_value_t decode_primary_key(const std::string& pk) {
    json j = json::parse(pk, nullptr, false);
    if (j.is_discarded()) {
        throw apply_changes_error("Malformed primary key: " + pk);
    }
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_null()) return nullptr;
    throw apply_changes_error("Unsupported primary key: " + pk);
}

json change_to_json(const change& c) {
    json j;
    j["table"] = c.table;
    j["pk"] = c.pk;
    j["cid"] = c.cid;
    j["val"] = value_to_json(c.val);
    j["col_version"] = c.col_version;
    j["db_version"] = c.db_version;
    j["site_id"] = c.site_id;
    j["cl"] = c.cl;
    j["seq"] = c.seq;
    return j;
}

change change_from_json(const json& j) {
    change c;
    c.table = j.at("table").get<std::string>();
    // pk is normally the key's JSON text; a raw JSON key is accepted too.
    const auto& pk = j.at("pk");
    c.pk = pk.is_string() ? pk.get<std::string>() : pk.dump();
    c.cid = j.at("cid").get<std::string>();
    c.val = j.contains("val") ? value_from_json(j["val"]) : column_value_t(nullptr);
    c.col_version = j.at("col_version").get<int64_t>();
    c.db_version = j.at("db_version").get<int64_t>();
    c.site_id = j.at("site_id").get<std::string>();
    c.cl = j.value("cl", int64_t(1));
    c.seq = j.value("seq", int64_t(0));
    return c;
}

static json changes_to_json(const std::vector<change>& changes) {
    json arr = json::array();
    for (const auto& c : changes) {
        arr.push_back(change_to_json(c));
    }
    return arr;
}

static std::vector<change> changes_from_json(const json& arr) {
    if (!arr.is_array()) {
        throw std::invalid_argument("changes must be an array");
    }
    std::vector<change> changes;
    changes.reserve(arr.size());
    for (const auto& item : arr) {
        changes.push_back(change_from_json(item));
    }
    return changes;
}

// ============================================================================
// client_message
// ============================================================================

std::string client_message::to_json() const {
    json j;
    if (message_type == type::ping) {
        j["type"] = "ping";
        return j.dump();
    }
    j["type"] = "changes";
    j["changes"] = changes_to_json(changes);
    j["baseVersion"] = base_version;
    if (!message_id.empty()) {
        j["messageId"] = message_id;
    }
    return j.dump();
}

std::optional<client_message> client_message::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        auto kind = j.at("type").get<std::string>();
        if (kind == "ping") {
            return client_message::ping();
        }
        if (kind == "changes") {
            client_message msg;
            msg.changes = changes_from_json(j.at("changes"));
            msg.base_version = j.value("baseVersion", version_t(0));
            msg.message_id = j.value("messageId", std::string());
            return msg;
        }
    } catch (const json::exception& e) {
        LOG_DEBUG("protocol", "Malformed client message: %s", e.what());
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG("protocol", "Malformed client message: %s", e.what());
    }
    return std::nullopt;
}

// ============================================================================
// server_message
// ============================================================================

std::string server_message::to_json() const {
    json j;
    switch (message_type) {
        case type::changes:
            j["type"] = "changes";
            j["changes"] = changes_to_json(changes);
            j["version"] = version;
            break;
        case type::ack:
            j["type"] = "ack";
            j["version"] = version;
            if (message_id) j["messageId"] = *message_id;
            if (pending_changes) j["pendingChanges"] = *pending_changes;
            break;
        case type::lock:
            j["type"] = "lock";
            j["state"] = capsync::to_string(state);
            j["holder"] = holder ? json(*holder) : json(nullptr);
            break;
        case type::session_transferred:
            j["type"] = "session_transferred";
            j["newTabId"] = new_tab_id;
            break;
        case type::error:
            j["type"] = "error";
            j["detail"] = detail;
            break;
    }
    return j.dump();
}

std::optional<server_message> server_message::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            return std::nullopt;
        }
        auto kind = j["type"].get<std::string>();
        server_message msg;

        if (kind == "changes") {
            msg.message_type = type::changes;
            msg.changes = changes_from_json(j.at("changes"));
            msg.version = j.at("version").get<version_t>();
            return msg;
        } else if (kind == "ack") {
            msg.message_type = type::ack;
            msg.version = j.at("version").get<version_t>();
            if (j.contains("messageId") && j["messageId"].is_string()) {
                msg.message_id = j["messageId"].get<std::string>();
            }
            if (j.contains("pendingChanges") && j["pendingChanges"].is_number_integer()) {
                msg.pending_changes = j["pendingChanges"].get<int64_t>();
            }
            return msg;
        } else if (kind == "lock") {
            msg.message_type = type::lock;
            auto state = lock_state_from_string(j.at("state").get<std::string>());
            if (!state) return std::nullopt;
            msg.state = *state;
            if (j.contains("holder") && j["holder"].is_string()) {
                msg.holder = j["holder"].get<std::string>();
            }
            return msg;
        } else if (kind == "session_transferred") {
            msg.message_type = type::session_transferred;
            msg.new_tab_id = j.value("newTabId", std::string());
            return msg;
        } else if (kind == "error") {
            msg.message_type = type::error;
            const auto& detail = j.contains("detail") ? j["detail"] : json();
            msg.detail = detail.is_string() ? detail.get<std::string>() : detail.dump();
            return msg;
        }
    } catch (const json::exception& e) {
        LOG_DEBUG("protocol", "Malformed server message: %s", e.what());
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG("protocol", "Malformed server message: %s", e.what());
    }
    return std::nullopt;
}

// ============================================================================
// lock_response
// ============================================================================

std::string lock_response::to_json() const {
    json j;
    j["state"] = capsync::to_string(state);
    j["holder"] = holder ? json(*holder) : json(nullptr);
    j["canEdit"] = can_edit;
    return j.dump();
}

std::optional<lock_response> lock_response::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        auto state = lock_state_from_string(j.at("state").get<std::string>());
        if (!state) return std::nullopt;

        lock_response response;
        response.state = *state;
        if (j.contains("holder") && j["holder"].is_string()) {
            response.holder = j["holder"].get<std::string>();
        }
        response.can_edit = j.value("canEdit", false);
        return response;
    } catch (const json::exception& e) {
        LOG_DEBUG("protocol", "Malformed lock response: %s", e.what());
    }
    return std::nullopt;
}

// ============================================================================
// Instance metadata
// ============================================================================

std::string metadata_to_json(const std::vector<instance_metadata>& entries) {
    json arr = json::array();
    for (const auto& entry : entries) {
        json j;
        j["instanceId"] = entry.instance_id;
        j["videoId"] = entry.video_id;
        j["databaseName"] = entry.database_name;
        j["version"] = entry.version;
        if (entry.initialized_at) {
            j["initializedAt"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.initialized_at->time_since_epoch()).count();
        } else {
            j["initializedAt"] = nullptr;
        }
        arr.push_back(std::move(j));
    }
    return arr.dump();
}

std::optional<std::vector<instance_metadata>> metadata_from_json(const std::string& json_str) {
    try {
        json arr = json::parse(json_str);
        if (!arr.is_array()) return std::nullopt;

        std::vector<instance_metadata> entries;
        for (const auto& j : arr) {
            instance_metadata entry;
            entry.video_id = j.at("videoId").get<std::string>();
            entry.database_name = j.at("databaseName").get<std::string>();
            entry.instance_id = j.value("instanceId",
                instance_id(entry.video_id, entry.database_name).to_string());
            entry.version = j.value("version", version_t(0));
            if (j.contains("initializedAt") && j["initializedAt"].is_number_integer()) {
                entry.initialized_at = timestamp_t(
                    std::chrono::milliseconds(j["initializedAt"].get<int64_t>()));
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    } catch (const json::exception& e) {
        LOG_WARN("protocol", "Malformed metadata: %s", e.what());
    }
    return std::nullopt;
}

} // namespace capsync
