#include "capsync/engine.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include "capsync/protocol.hpp"
#include <algorithm>
#include <charconv>
#include <cstring>
#include <sstream>

namespace capsync {

namespace {

constexpr const char* meta_table = "__capsync_meta";
constexpr const char* clock_table = "__capsync_clock";
constexpr const char* internal_prefix = "__capsync_";

// Values the triggers read at capture time.
constexpr const char* next_version_sql =
    "((SELECT value FROM __capsync_meta WHERE key = 'db_version') + 1)";
constexpr const char* site_sql =
    "(SELECT value FROM __capsync_meta WHERE key = 'site_id')";
constexpr const char* seq_sql =
    "(SELECT value FROM __capsync_meta WHERE key = 'seq')";
constexpr const char* bump_seq_sql =
    "UPDATE __capsync_meta SET value = value + 1 WHERE key = 'seq';\n";
constexpr const char* capturing_sql =
    "(SELECT value FROM __capsync_meta WHERE key = 'capture') = 1";

constexpr const char sqlite_header[] = "SQLite format 3";  // 16 bytes with the NUL

std::string literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

int64_t as_int(const column_value_t& v) {
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    if (auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto* s = std::get_if<std::string>(&v)) {
        int64_t value = 0;
        auto [end, ec] = std::from_chars(s->data(), s->data() + s->size(), value);
        if (ec != std::errc() || end != s->data() + s->size()) {
            throw query_error("Expected an integer, found '" + *s + "'");
        }
        return value;
    }
    return 0;
}

std::string as_text(const column_value_t& v) {
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    if (auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    return "";
}

/// Total order within one causal length.
bool newer(const change& a, const change& b) {
    if (a.col_version != b.col_version) return a.col_version > b.col_version;
    return a.site_id > b.site_id;
}

// Trigger bodies. `ref` is NEW or OLD.
std::string pk_expr(const std::string& ref, const std::string& pk) {
    return "json_quote(" + ref + "." + quote_identifier(pk) + ")";
}

std::string sentinel_cl_sql(const std::string& table, const std::string& pk_sql) {
    return "(SELECT cl FROM __capsync_clock WHERE tbl = " + literal(table) +
           " AND pk = " + pk_sql + " AND cid = '-1')";
}

std::string column_clock_sql(const std::string& table, const std::string& pk_sql,
                             const std::string& column) {
    std::ostringstream sql;
    sql << bump_seq_sql
        << "INSERT INTO __capsync_clock (tbl, pk, cid, col_version, db_version, site_id, cl, seq) VALUES ("
        << literal(table) << ", " << pk_sql << ", " << literal(column) << ", 1, "
        << next_version_sql << ", " << site_sql << ", "
        << "COALESCE(" << sentinel_cl_sql(table, pk_sql) << ", 1), " << seq_sql << ")\n"
        << "  ON CONFLICT (tbl, pk, cid) DO UPDATE SET col_version = col_version + 1, "
        << "db_version = excluded.db_version, site_id = excluded.site_id, "
        << "cl = excluded.cl, seq = excluded.seq;\n";
    return sql.str();
}

std::string row_created_sql(const std::string& table, const std::string& pk,
                            const std::vector<std::string>& columns) {
    auto pk_sql = pk_expr("NEW", pk);
    std::ostringstream sql;
    sql << bump_seq_sql
        << "INSERT INTO __capsync_clock (tbl, pk, cid, col_version, db_version, site_id, cl, seq) VALUES ("
        << literal(table) << ", " << pk_sql << ", '-1', 1, "
        << next_version_sql << ", " << site_sql << ", 1, " << seq_sql << ")\n"
        << "  ON CONFLICT (tbl, pk, cid) DO UPDATE SET "
        << "cl = CASE WHEN cl % 2 = 0 THEN cl + 1 ELSE cl END, "
        << "col_version = CASE WHEN cl % 2 = 0 THEN cl + 1 ELSE col_version END, "
        << "db_version = excluded.db_version, site_id = excluded.site_id, seq = excluded.seq;\n";
    for (const auto& column : columns) {
        sql << column_clock_sql(table, pk_sql, column);
    }
    return sql.str();
}

std::string row_deleted_sql(const std::string& table, const std::string& pk) {
    auto pk_sql = pk_expr("OLD", pk);
    std::ostringstream sql;
    sql << bump_seq_sql
        << "INSERT INTO __capsync_clock (tbl, pk, cid, col_version, db_version, site_id, cl, seq) VALUES ("
        << literal(table) << ", " << pk_sql << ", '-1', 2, "
        << next_version_sql << ", " << site_sql << ", 2, " << seq_sql << ")\n"
        << "  ON CONFLICT (tbl, pk, cid) DO UPDATE SET "
        << "cl = CASE WHEN cl % 2 = 1 THEN cl + 1 ELSE cl END, "
        << "col_version = CASE WHEN cl % 2 = 1 THEN cl + 1 ELSE col_version END, "
        << "db_version = excluded.db_version, site_id = excluded.site_id, seq = excluded.seq;\n"
        << "DELETE FROM __capsync_clock WHERE tbl = " << literal(table)
        << " AND pk = " << pk_sql << " AND cid <> '-1';\n";
    return sql.str();
}

std::string trigger_name(const std::string& table, const std::string& suffix) {
    return quote_identifier(std::string(internal_prefix) + table + "_" + suffix);
}

} // namespace

// ============================================================================
// Open / close
// ============================================================================

changeset_engine::changeset_engine(std::unique_ptr<database> db) : db_(std::move(db)) {}

changeset_engine::~changeset_engine() = default;

std::unique_ptr<changeset_engine> changeset_engine::open(const byte_vector& image,
                                                         const engine_options& options) {
    if (image.empty()) {
        throw corrupt_image_error("image is empty");
    }
    if (image.size() < 100 || std::memcmp(image.data(), sqlite_header, sizeof(sqlite_header)) != 0) {
        throw corrupt_image_error("missing SQLite header");
    }

    std::unique_ptr<database> db;
    try {
        db = std::make_unique<database>(database::from_image(image));
        auto check = db->query_value("PRAGMA quick_check");
        if (as_text(check) != "ok") {
            throw corrupt_image_error("integrity check failed: " + as_text(check));
        }
    } catch (const query_error& e) {
        throw corrupt_image_error(e.what());
    }

    std::unique_ptr<changeset_engine> engine(new changeset_engine(std::move(db)));
    try {
        engine->install_bookkeeping(options.site_id.empty() ? uuid_t::generate().to_string()
                                                            : options.site_id);
    } catch (const query_error& e) {
        // The header and quick_check passed but the schema is unusable.
        throw corrupt_image_error(e.what());
    }

    for (const auto& table : options.tracked_tables) {
        engine->track(table);
    }

    LOG_DEBUG("engine", "Opened image (%zu bytes) at version %lld, site %s",
              image.size(), static_cast<long long>(engine->version_), engine->site_id_.c_str());
    return engine;
}

void changeset_engine::close() {
    db_.reset();
    tables_.clear();
}

database& changeset_engine::handle() const {
    if (!db_) {
        throw query_error("database is closed");
    }
    return *db_;
}

std::vector<std::string> changeset_engine::tracked_tables() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tables_) names.push_back(name);
    return names;
}

void changeset_engine::install_bookkeeping(const std::string& site_id) {
    auto& db = handle();
    bool had_meta = db.table_exists(meta_table);
    version_t initial = had_meta ? 0 : as_int(db.query_value("PRAGMA user_version"));

    db.execute(
        "CREATE TABLE IF NOT EXISTS __capsync_meta (key TEXT PRIMARY KEY, value);"
        "CREATE TABLE IF NOT EXISTS __capsync_clock ("
        "  tbl TEXT NOT NULL, pk TEXT NOT NULL, cid TEXT NOT NULL,"
        "  col_version INTEGER NOT NULL, db_version INTEGER NOT NULL,"
        "  site_id TEXT NOT NULL, cl INTEGER NOT NULL, seq INTEGER NOT NULL,"
        "  PRIMARY KEY (tbl, pk, cid));"
        "CREATE INDEX IF NOT EXISTS __capsync_clock_version ON __capsync_clock (db_version, seq);");

    db.execute("INSERT OR IGNORE INTO __capsync_meta (key, value) VALUES ('db_version', ?)", {initial});
    db.execute("INSERT OR IGNORE INTO __capsync_meta (key, value) VALUES ('seq', ?)", {int64_t(0)});
    set_meta("capture", int64_t(1));
    set_meta("site_id", site_id);

    site_id_ = site_id;
    version_ = stored_version();
}

void changeset_engine::set_meta(const std::string& key, const column_value_t& value) {
    handle().execute("INSERT OR REPLACE INTO __capsync_meta (key, value) VALUES (?, ?)", {key, value});
}

version_t changeset_engine::stored_version() {
    return as_int(handle().query_value("SELECT value FROM __capsync_meta WHERE key = 'db_version'"));
}

void changeset_engine::track(const std::string& table) {
    auto& db = handle();
    if (table.rfind(internal_prefix, 0) == 0) {
        throw query_error("Cannot track internal table " + table);
    }
    if (!db.table_exists(table)) {
        LOG_DEBUG("engine", "Tracked table %s not in image, skipping", table.c_str());
        return;
    }

    auto keys = db.primary_key(table);
    if (keys.size() > 1) {
        throw query_error("Table " + table + " has a composite primary key; only single-column keys can be tracked");
    }

    table_info info;
    info.name = table;
    info.pk = keys.empty() ? "rowid" : keys.front();
    for (auto& column : db.column_names(table)) {
        if (column != info.pk) info.columns.push_back(std::move(column));
    }

    install_triggers(info);
    tables_[table] = std::move(info);
}

void changeset_engine::install_triggers(const table_info& table) {
    auto& db = handle();

    // Drop whatever an earlier open left behind; the column set may differ.
    auto existing = db.query(
        "SELECT name FROM sqlite_master WHERE type = 'trigger' AND tbl_name = ? AND name LIKE '\\_\\_capsync\\_%' ESCAPE '\\'",
        {table.name});
    for (const auto& row : existing) {
        db.execute("DROP TRIGGER IF EXISTS " + quote_identifier(as_text(row.at("name"))));
    }

    const auto& name = table.name;
    const auto tbl = quote_identifier(name);
    const auto pk = quote_identifier(table.pk);

    std::ostringstream sql;
    sql << "CREATE TRIGGER " << trigger_name(name, "ins") << " AFTER INSERT ON " << tbl
        << " WHEN " << capturing_sql << "\nBEGIN\n"
        << row_created_sql(name, table.pk, table.columns)
        << "END;\n";

    sql << "CREATE TRIGGER " << trigger_name(name, "del") << " AFTER DELETE ON " << tbl
        << " WHEN " << capturing_sql << "\nBEGIN\n"
        << row_deleted_sql(name, table.pk)
        << "END;\n";

    // A key change is a delete of the old row plus a create of the new one.
    sql << "CREATE TRIGGER " << trigger_name(name, "pk") << " AFTER UPDATE ON " << tbl
        << " WHEN " << capturing_sql << " AND OLD." << pk << " IS NOT NEW." << pk << "\nBEGIN\n"
        << row_deleted_sql(name, table.pk)
        << row_created_sql(name, table.pk, table.columns)
        << "END;\n";

    for (const auto& column : table.columns) {
        auto col = quote_identifier(column);
        sql << "CREATE TRIGGER " << trigger_name(name, "upd_" + column)
            << " AFTER UPDATE OF " << col << " ON " << tbl
            << " WHEN " << capturing_sql
            << " AND OLD." << pk << " IS NEW." << pk
            << " AND OLD." << col << " IS NOT NEW." << col << "\nBEGIN\n"
            << column_clock_sql(name, pk_expr("NEW", table.pk), column)
            << "END;\n";
    }

    db.execute(sql.str());
}

// ============================================================================
// Local reads and writes
// ============================================================================

std::vector<row_t> changeset_engine::query(const std::string& sql,
                                           const std::vector<column_value_t>& params) {
    auto& db = handle();
    if (!db.is_read_only(sql)) {
        throw query_error("query() accepts a single read-only statement; use exec() to write");
    }
    return db.query(sql, params);
}

int64_t changeset_engine::exec(const std::string& sql, const std::vector<column_value_t>& params) {
    auto& db = handle();
    const version_t next = version_ + 1;

    transaction tx(db);
    db.execute(sql, params);
    int64_t affected = db.changes();

    auto captured = as_int(db.query_value(
        "SELECT COUNT(*) FROM __capsync_clock WHERE db_version = ?", {next}));
    if (captured > 0) {
        set_meta("db_version", next);
    }
    tx.commit();

    if (captured > 0) {
        version_ = next;
        LOG_DEBUG("engine", "exec captured %lld changes at version %lld",
                  static_cast<long long>(captured), static_cast<long long>(version_));
    }
    return affected;
}

version_info changeset_engine::get_version_info() const {
    handle();
    return {version_, site_id_};
}

change_set changeset_engine::changes_since(version_t since) {
    auto& db = handle();

    change_set result;
    result.origin_version = since;
    result.resulting_version = version_;

    auto rows = db.query(
        "SELECT tbl, pk, cid, col_version, db_version, site_id, cl, seq FROM __capsync_clock "
        "WHERE db_version > ? ORDER BY db_version, seq",
        {since});

    for (const auto& row : rows) {
        change c;
        c.table = as_text(row.at("tbl"));
        c.pk = as_text(row.at("pk"));
        c.cid = as_text(row.at("cid"));
        c.col_version = as_int(row.at("col_version"));
        c.db_version = as_int(row.at("db_version"));
        c.site_id = as_text(row.at("site_id"));
        c.cl = as_int(row.at("cl"));
        c.seq = as_int(row.at("seq"));

        auto table = tables_.find(c.table);
        if (c.cid != row_sentinel_cid && table != tables_.end()) {
            c.val = db.query_value(
                "SELECT " + quote_identifier(c.cid) + " FROM " + quote_identifier(c.table) +
                " WHERE " + quote_identifier(table->second.pk) + " = ?",
                {decode_primary_key(c.pk)});
        }
        result.changes.push_back(std::move(c));
    }
    return result;
}

byte_vector changeset_engine::serialize() {
    return handle().serialize();
}

void changeset_engine::advance_version(version_t version) {
    if (version <= version_) return;
    set_meta("db_version", version);
    version_ = version;
}

// ============================================================================
// Merge
// ============================================================================

version_t changeset_engine::apply_changes(const change_set& changes) {
    auto& db = handle();

    version_t target = std::max(version_, changes.resulting_version);
    for (const auto& c : changes.changes) {
        target = std::max(target, c.db_version);
    }

    try {
        transaction tx(db);
        set_meta("capture", int64_t(0));

        // Group by row, keeping delivery order between rows.
        std::vector<std::pair<std::string, std::string>> order;
        std::map<std::pair<std::string, std::string>, std::vector<const change*>> groups;
        for (const auto& c : changes.changes) {
            auto key = std::make_pair(c.table, c.pk);
            auto& group = groups[key];
            if (group.empty()) order.push_back(key);
            group.push_back(&c);
        }

        for (const auto& key : order) {
            auto table = tables_.find(key.first);
            if (table == tables_.end()) {
                throw apply_changes_error("Change for untracked table " + key.first);
            }
            merge_row(table->second, key.second, groups[key], target);
        }

        set_meta("capture", int64_t(1));
        set_meta("db_version", target);
        tx.commit();
    } catch (const apply_changes_error& e) {
        LOG_ERROR("engine", "applyChanges failed: %s", e.what());
        throw;
    } catch (const database_error& e) {
        LOG_ERROR("engine", "applyChanges failed: %s", e.what());
        throw apply_changes_error(e.what());
    }

    version_ = target;
    return version_;
}

void changeset_engine::merge_row(const table_info& table, const std::string& pk,
                                 const std::vector<const change*>& group, version_t target) {
    auto& db = handle();
    const column_value_t key = decode_primary_key(pk);
    const auto tbl = quote_identifier(table.name);
    const auto pk_col = quote_identifier(table.pk);

    const bool exists = row_exists(table, key);
    const auto local_sentinel = load_clock(table.name, pk, row_sentinel_cid);
    const int64_t local_cl = local_sentinel ? local_sentinel->cl : (exists ? 1 : 0);

    int64_t incoming_cl = 0;
    for (const auto* c : group) incoming_cl = std::max(incoming_cl, c->cl);
    if (incoming_cl < local_cl) {
        return;  // stale
    }

    // Winning sentinel and winning value per column at the incoming causal length.
    const change* sentinel = nullptr;
    std::map<std::string, const change*> columns;
    for (const auto* c : group) {
        if (c->cl != incoming_cl) continue;
        if (c->cid == row_sentinel_cid) {
            if (!sentinel || newer(*c, *sentinel)) sentinel = c;
            continue;
        }
        if (std::find(table.columns.begin(), table.columns.end(), c->cid) == table.columns.end()) {
            throw apply_changes_error("Change for unknown column " + table.name + "." + c->cid);
        }
        auto& best = columns[c->cid];
        if (!best || newer(*c, *best)) best = c;
    }

    change lifetime;
    if (sentinel) {
        lifetime = *sentinel;
    } else {
        lifetime.table = table.name;
        lifetime.pk = pk;
        lifetime.cid = row_sentinel_cid;
        lifetime.col_version = incoming_cl;
        lifetime.cl = incoming_cl;
        lifetime.site_id = group.front()->site_id;
    }

    if (incoming_cl > local_cl) {
        // The row's lifetime moved on; local column clocks no longer apply.
        db.execute("DELETE FROM __capsync_clock WHERE tbl = ? AND pk = ? AND cid <> '-1'",
                   {table.name, pk});

        if (incoming_cl % 2 == 0) {
            if (exists) {
                db.execute("DELETE FROM " + tbl + " WHERE " + pk_col + " = ?", {key});
            }
            store_clock(table.name, pk, lifetime, target);
            return;
        }

        std::vector<column_value_t> params;
        if (!exists) {
            std::string names = pk_col;
            std::string placeholders = "?";
            params.push_back(key);
            for (const auto& [column, c] : columns) {
                names += ", " + quote_identifier(column);
                placeholders += ", ?";
                params.push_back(c->val);
            }
            db.execute("INSERT INTO " + tbl + " (" + names + ") VALUES (" + placeholders + ")", params);
        } else if (!columns.empty()) {
            std::string assignments;
            for (const auto& [column, c] : columns) {
                if (!assignments.empty()) assignments += ", ";
                assignments += quote_identifier(column) + " = ?";
                params.push_back(c->val);
            }
            params.push_back(key);
            db.execute("UPDATE " + tbl + " SET " + assignments + " WHERE " + pk_col + " = ?", params);
        }

        store_clock(table.name, pk, lifetime, target);
        for (const auto& [column, c] : columns) {
            store_clock(table.name, pk, *c, target);
        }
        return;
    }

    // Same causal length: last writer wins per column.
    if (sentinel && (!local_sentinel ||
                     sentinel->col_version > local_sentinel->col_version ||
                     (sentinel->col_version == local_sentinel->col_version &&
                      sentinel->site_id > local_sentinel->site_id))) {
        store_clock(table.name, pk, *sentinel, target);
    }

    if (local_cl % 2 == 0) {
        return;  // deleted on both sides
    }

    for (const auto& [column, c] : columns) {
        auto local = load_clock(table.name, pk, column);
        bool wins = !local ||
                    c->col_version > local->col_version ||
                    (c->col_version == local->col_version && c->site_id > local->site_id);
        if (!wins) continue;

        db.execute("UPDATE " + tbl + " SET " + quote_identifier(column) + " = ? WHERE " + pk_col + " = ?",
                   {c->val, key});
        store_clock(table.name, pk, *c, target);
    }
}

std::optional<changeset_engine::clock_entry> changeset_engine::load_clock(
        const std::string& table, const std::string& pk, const std::string& cid) {
    auto rows = handle().query(
        "SELECT col_version, site_id, cl FROM __capsync_clock WHERE tbl = ? AND pk = ? AND cid = ?",
        {table, pk, cid});
    if (rows.empty()) return std::nullopt;

    clock_entry entry;
    entry.col_version = as_int(rows.front().at("col_version"));
    entry.site_id = as_text(rows.front().at("site_id"));
    entry.cl = as_int(rows.front().at("cl"));
    return entry;
}

void changeset_engine::store_clock(const std::string& table, const std::string& pk, const change& c,
                                   version_t db_version) {
    handle().execute(
        "INSERT INTO __capsync_clock (tbl, pk, cid, col_version, db_version, site_id, cl, seq) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT (tbl, pk, cid) DO UPDATE SET col_version = excluded.col_version, "
        "db_version = excluded.db_version, site_id = excluded.site_id, "
        "cl = excluded.cl, seq = excluded.seq",
        {table, pk, c.cid, c.col_version, db_version, c.site_id, c.cl, c.seq});
}

bool changeset_engine::row_exists(const table_info& table, const column_value_t& key) {
    auto value = handle().query_value(
        "SELECT 1 FROM " + quote_identifier(table.name) + " WHERE " + quote_identifier(table.pk) + " = ?",
        {key});
    return !std::holds_alternative<std::nullptr_t>(value);
}

} // namespace capsync
