#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <unordered_map>

namespace capsync {

// Timestamp type (wall clock, serialized as milliseconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// Replica version (monotonic, CR-SQLite db_version)
using version_t = int64_t;

using byte_vector = std::vector<uint8_t>;

// Column value type for database operations
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>
>;

using row_t = std::unordered_map<std::string, column_value_t>;

// UUID type (lowercase hyphenated text form)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    std::string to_string() const;

    // Generate a random UUID (v4)
    static uuid_t generate();

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
};

// ============================================================================
// Instance identity
// ============================================================================

namespace database_names {
    inline constexpr const char* layout = "layout";
    inline constexpr const char* captions = "captions";
}

/// Tables replicated by default for a database name. Unknown names replicate
/// nothing unless the configuration names tables explicitly.
std::vector<std::string> default_tracked_tables(const std::string& database_name);

/// (videoId, databaseName) key of one replicated database.
struct instance_id {
    std::string video_id;
    std::string database_name;

    instance_id() = default;
    instance_id(std::string video, std::string db)
        : video_id(std::move(video)), database_name(std::move(db)) {}

    /// "<videoId>:<databaseName>"
    std::string to_string() const { return video_id + ":" + database_name; }

    /// Inverse of to_string(). nullopt unless exactly two non-empty parts.
    static std::optional<instance_id> parse(const std::string& s);

    bool operator==(const instance_id& other) const {
        return video_id == other.video_id && database_name == other.database_name;
    }
    bool operator!=(const instance_id& other) const { return !(*this == other); }
    bool operator<(const instance_id& other) const {
        return video_id < other.video_id ||
               (video_id == other.video_id && database_name < other.database_name);
    }
};

// ============================================================================
// Status types
// ============================================================================

enum class connection_state {
    disconnected,
    connecting,
    connected,
    reconnecting
};

const char* to_string(connection_state state);

enum class lock_state {
    released,
    pending,
    granted,
    transferring
};

const char* to_string(lock_state state);
std::optional<lock_state> lock_state_from_string(const std::string& s);

struct sync_status {
    bool connected = false;
    bool syncing = false;
    std::optional<timestamp_t> last_sync_time;
    /// Locally generated change sets not yet confirmed by the server.
    int64_t pending_changes = 0;
    connection_state state = connection_state::disconnected;
};

struct lock_status {
    lock_state state = lock_state::released;
    std::optional<std::string> holder;
    /// True only while state == granted and holder is this client.
    bool can_edit = false;

    bool operator==(const lock_status& other) const {
        return state == other.state && holder == other.holder && can_edit == other.can_edit;
    }
    bool operator!=(const lock_status& other) const { return !(*this == other); }
};

struct download_progress {
    uint64_t bytes_received = 0;
    uint64_t total_bytes = 0;   // 0 when the server sent no length
    int percent = 0;
    int attempt = 1;
};

// ============================================================================
// Change sets
// ============================================================================

/// Column id of the per-row sentinel entry (row created / deleted).
inline constexpr const char* row_sentinel_cid = "-1";

/// One column-level clock entry (crsql_changes shape).
struct change {
    std::string table;
    std::string pk;            // JSON text of the primary key value
    std::string cid;           // column name, or row_sentinel_cid
    column_value_t val = nullptr;
    int64_t col_version = 0;
    version_t db_version = 0;
    std::string site_id;
    int64_t cl = 1;            // causal length: odd = alive, even = deleted
    int64_t seq = 0;

    bool operator==(const change& other) const {
        return table == other.table && pk == other.pk && cid == other.cid &&
               val == other.val && col_version == other.col_version &&
               db_version == other.db_version && site_id == other.site_id &&
               cl == other.cl && seq == other.seq;
    }
};

struct change_set {
    version_t origin_version = 0;
    version_t resulting_version = 0;
    std::vector<change> changes;

    bool empty() const { return changes.empty(); }
    size_t size() const { return changes.size(); }
};

/// The only instance state that survives a reload.
struct instance_metadata {
    std::string instance_id;
    std::string video_id;
    std::string database_name;
    version_t version = 0;
    std::optional<timestamp_t> initialized_at;
};

} // namespace capsync
