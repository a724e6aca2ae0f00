#pragma once

#include <CapSync.hpp>
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace capsync_tests {

using namespace capsync;

inline const char* captions_schema =
    "CREATE TABLE captions ("
    "  id INTEGER PRIMARY KEY,"
    "  start_ms INTEGER NOT NULL DEFAULT 0,"
    "  end_ms INTEGER NOT NULL DEFAULT 0,"
    "  text TEXT);";

inline const char* layout_schema =
    "CREATE TABLE boxes (id INTEGER PRIMARY KEY, x REAL, y REAL, width REAL, height REAL, label TEXT);"
    "CREATE TABLE layout_config (key TEXT PRIMARY KEY, value TEXT);"
    "CREATE TABLE preferences (key TEXT PRIMARY KEY, value TEXT);";

/// Serialized SQLite image built from `schema` (+ optional seed rows).
inline byte_vector make_image(const std::string& schema, int64_t user_version = 0,
                              const std::string& seed = "") {
    database db(":memory:");
    db.execute(schema);
    if (!seed.empty()) db.execute(seed);
    db.execute("PRAGMA user_version = " + std::to_string(user_version));
    return db.serialize();
}

inline byte_vector captions_image(int64_t user_version = 0, const std::string& seed = "") {
    return make_image(captions_schema, user_version, seed);
}

inline engine_options captions_options(const std::string& site_id = "") {
    engine_options options;
    options.tracked_tables = default_tracked_tables(database_names::captions);
    options.site_id = site_id;
    return options;
}

inline http_response ok_body(const byte_vector& body) {
    http_response response;
    response.status_code = 200;
    response.body = body;
    response.headers["Content-Length"] = std::to_string(body.size());
    return response;
}

inline http_response status_only(int status) {
    http_response response;
    response.status_code = status;
    if (status == 0) response.error = "connection reset";
    return response;
}

inline std::string granted_to(const std::string& holder) {
    lock_response response;
    response.state = lock_state::granted;
    response.holder = holder;
    response.can_edit = true;
    return response.to_json();
}

inline std::string held_by(const std::string& holder) {
    lock_response response;
    response.state = lock_state::granted;
    response.holder = holder;
    response.can_edit = false;
    return response.to_json();
}

inline std::string ack_message(version_t version, std::optional<int64_t> pending = std::nullopt) {
    server_message msg;
    msg.message_type = server_message::type::ack;
    msg.version = version;
    msg.pending_changes = pending;
    return msg.to_json();
}

inline std::string changes_message(const change_set& changes) {
    server_message msg;
    msg.message_type = server_message::type::changes;
    msg.version = changes.resulting_version;
    msg.changes = changes.changes;
    return msg.to_json();
}

inline std::string lock_message(lock_state state, std::optional<std::string> holder) {
    server_message msg;
    msg.message_type = server_message::type::lock;
    msg.state = state;
    msg.holder = std::move(holder);
    return msg.to_json();
}

inline int64_t as_int(const column_value_t& value) {
    return std::get<int64_t>(value);
}

inline std::string as_text(const column_value_t& value) {
    return std::get<std::string>(value);
}

inline int64_t count_rows(changeset_engine& engine, const std::string& table) {
    return as_int(engine.query("SELECT COUNT(*) AS n FROM " + table).front().at("n"));
}

} // namespace capsync_tests
