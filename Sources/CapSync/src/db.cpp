#include "capsync/db.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include <cctype>
#include <cstring>
#include <map>

namespace capsync {

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw query_error("Failed to open database: " + error);
    }
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

database database::from_image(const byte_vector& image) {
    database db(":memory:");

    // SQLite takes ownership of the buffer (FREEONCLOSE), so it must come
    // from sqlite3_malloc64.
    auto size = static_cast<sqlite3_int64>(image.size());
    auto* buffer = static_cast<unsigned char*>(sqlite3_malloc64(static_cast<sqlite3_uint64>(size)));
    if (!buffer) {
        throw query_error("Out of memory copying database image");
    }
    std::memcpy(buffer, image.data(), image.size());

    int rc = sqlite3_deserialize(db.db_, "main", buffer, size, size,
                                 SQLITE_DESERIALIZE_FREEONCLOSE | SQLITE_DESERIALIZE_RESIZEABLE);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db.db_);
        LOG_ERROR("db", "Failed to deserialize image: %s", error.c_str());
        throw query_error("Failed to deserialize image: " + error);
    }
    return db;
}

byte_vector database::serialize() const {
    sqlite3_int64 size = 0;
    unsigned char* data = sqlite3_serialize(db_, "main", &size, 0);
    if (!data) {
        // An empty database serializes to nothing.
        if (size == 0) return {};
        throw query_error("Failed to serialize database: " + std::string(sqlite3_errmsg(db_)));
    }
    byte_vector out(data, data + size);
    sqlite3_free(data);
    return out;
}

sqlite3_stmt* database::prepare(const std::string& sql, const char** tail) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, tail);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw query_error("Failed to prepare statement: " + error);
    }
    if (!stmt) {
        throw query_error("Empty statement");
    }
    return stmt;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless scripts
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw query_error("SQL execution failed: " + error);
        }
        return;
    }

    sqlite3_stmt* stmt = prepare(sql);

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        // RETURNING rows are discarded.
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw query_error("Execution failed: " + error);
    }
}

int64_t database::changes() const {
    return static_cast<int64_t>(sqlite3_changes(db_));
}

bool database::is_read_only(const std::string& sql) {
    const char* tail = nullptr;
    sqlite3_stmt* stmt = prepare(sql, &tail);
    bool read_only = sqlite3_stmt_readonly(stmt) != 0;
    sqlite3_finalize(stmt);

    // Anything after the first statement other than whitespace or ';' makes
    // this a script.
    if (tail) {
        for (const char* p = tail; *p; ++p) {
            if (!std::isspace(static_cast<unsigned char>(*p)) && *p != ';') {
                return false;
            }
        }
    }
    return read_only;
}

bool database::table_exists(const std::string& name) {
    auto value = query_value("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {name});
    return !std::holds_alternative<std::nullptr_t>(value);
}

std::vector<std::string> database::column_names(const std::string& table) {
    std::vector<std::string> names;
    sqlite3_stmt* stmt = prepare("PRAGMA table_info(" + quote_identifier(table) + ")");
    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (name) names.emplace_back(name);
    }
    sqlite3_finalize(stmt);
    return names;
}

std::vector<std::string> database::primary_key(const std::string& table) {
    std::map<int, std::string> ordered;
    sqlite3_stmt* stmt = prepare("PRAGMA table_info(" + quote_identifier(table) + ")");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        int pk = sqlite3_column_int(stmt, 5);
        if (name && pk > 0) ordered[pk] = name;
    }
    sqlite3_finalize(stmt);

    std::vector<std::string> keys;
    for (auto& [_, name] : ordered) keys.push_back(std::move(name));
    return keys;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = prepare(sql);

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw query_error("Query failed: " + error);
    }

    return results;
}

column_value_t database::query_value(const std::string& sql,
                                     const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = prepare(sql);

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    column_value_t value = nullptr;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        value = extract_column(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw query_error("Query failed: " + error);
    }
    return value;
}

void database::begin_transaction() {
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const database_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace capsync
