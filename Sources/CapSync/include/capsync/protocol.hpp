#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace capsync {

// ============================================================================
// Tagged column values
// ============================================================================
//
// Values travel as {"kind": int, "value": ...}. Blobs are hex strings.

enum class value_kind : int {
    int64_kind = 1,
    string_kind = 2,
    null_kind = 4,
    data_kind = 6,
    double_kind = 7
};

nlohmann::json value_to_json(const column_value_t& value);

/// Accepts the tagged form and raw JSON scalars.
column_value_t value_from_json(const nlohmann::json& j);

std::string to_hex(const byte_vector& data);
byte_vector from_hex(const std::string& hex);

/// JSON text used as the wire form of a primary key value.
std::string encode_primary_key(const column_value_t& value);
column_value_t decode_primary_key(const std::string& pk);

nlohmann::json change_to_json(const change& c);
change change_from_json(const nlohmann::json& j);

// ============================================================================
// Sync channel messages
// ============================================================================

/// Frames this client sends.
struct client_message {
    enum class type { changes, ping };

    type message_type = type::changes;
    std::vector<change> changes;
    version_t base_version = 0;
    std::string message_id;

    static client_message ping() {
        client_message msg;
        msg.message_type = type::ping;
        return msg;
    }

    std::string to_json() const;
    static std::optional<client_message> from_json(const std::string& json_str);
};

/// Frames the server pushes.
struct server_message {
    enum class type { changes, ack, lock, session_transferred, error };

    type message_type = type::ack;

    // changes / ack
    std::vector<change> changes;
    version_t version = 0;
    std::optional<std::string> message_id;
    std::optional<int64_t> pending_changes;

    // lock
    lock_state state = lock_state::released;
    std::optional<std::string> holder;

    // session_transferred
    std::string new_tab_id;

    // error
    std::string detail;

    std::string to_json() const;

    /// nullopt for malformed JSON, a missing/unknown "type" or missing fields.
    static std::optional<server_message> from_json(const std::string& json_str);
};

// ============================================================================
// Lock service responses
// ============================================================================

struct lock_response {
    lock_state state = lock_state::released;
    std::optional<std::string> holder;
    bool can_edit = false;

    std::string to_json() const;
    static std::optional<lock_response> from_json(const std::string& json_str);
};

// ============================================================================
// Instance metadata (persist / restore boundary)
// ============================================================================

std::string metadata_to_json(const std::vector<instance_metadata>& entries);
std::optional<std::vector<instance_metadata>> metadata_from_json(const std::string& json_str);

} // namespace capsync
