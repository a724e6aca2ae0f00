#pragma once

#include "db.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsync {

struct engine_options {
    /// Tables whose writes are captured and merged. Missing tables are skipped.
    std::vector<std::string> tracked_tables;

    /// Replica identity used to break ties. Empty = random.
    std::string site_id;
};

struct version_info {
    version_t version = 0;
    std::string site_id;
};

// ============================================================================
// changeset_engine - one embedded replica
// ============================================================================
//
// Writes to tracked tables are recorded by triggers into a column-level clock
// table (one entry per table/pk/column plus a "-1" row sentinel). Remote
// change sets merge by causal length first (odd = alive, even = deleted), then
// per column by (col_version, site_id), so applying the same set twice or
// two sets in either order gives the same contents.

class changeset_engine {
public:
    /// Throws corrupt_image_error when the bytes are not a usable SQLite
    /// image, query_error when a tracked table has a composite primary key.
    static std::unique_ptr<changeset_engine> open(const byte_vector& image,
                                                  const engine_options& options = {});

    ~changeset_engine();

    changeset_engine(const changeset_engine&) = delete;
    changeset_engine& operator=(const changeset_engine&) = delete;

    /// Read-only statements only.
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Runs `sql` in a transaction. Returns rows affected by the last statement.
    int64_t exec(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    version_info get_version_info() const;
    version_t version() const { return version_; }

    /// Every clock entry with db_version > `since`, ordered by (db_version, seq).
    change_set changes_since(version_t since);

    /// Merge a remote change set. Returns the new version.
    version_t apply_changes(const change_set& changes);

    /// Raise the version floor (server acknowledged a later version).
    void advance_version(version_t version);

    byte_vector serialize();

    void close();
    bool is_open() const { return db_ != nullptr; }

    /// Tracked tables present in the image.
    std::vector<std::string> tracked_tables() const;

private:
    struct table_info {
        std::string name;
        std::string pk;                    // column name, or "rowid"
        std::vector<std::string> columns;  // non-key columns
    };

    struct clock_entry {
        int64_t col_version = 0;
        std::string site_id;
        int64_t cl = 0;
    };

    explicit changeset_engine(std::unique_ptr<database> db);

    database& handle() const;

    void install_bookkeeping(const std::string& site_id);
    void install_triggers(const table_info& table);
    void track(const std::string& table);

    void set_meta(const std::string& key, const column_value_t& value);
    version_t stored_version();

    void merge_row(const table_info& table, const std::string& pk,
                   const std::vector<const change*>& group, version_t target);

    std::optional<clock_entry> load_clock(const std::string& table, const std::string& pk,
                                          const std::string& cid);
    void store_clock(const std::string& table, const std::string& pk, const change& c,
                     version_t db_version);
    bool row_exists(const table_info& table, const column_value_t& key);

    std::unique_ptr<database> db_;
    std::map<std::string, table_info> tables_;
    version_t version_ = 0;
    std::string site_id_;
};

} // namespace capsync
