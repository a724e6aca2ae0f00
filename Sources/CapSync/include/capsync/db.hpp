#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace capsync {

/// One private SQLite connection. Errors surface as query_error carrying the
/// SQLite message.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    /// Open a private in-memory connection holding a copy of `image`.
    /// Throws query_error when SQLite refuses the bytes.
    static database from_image(const byte_vector& image);

    /// Current contents as a database file image.
    byte_vector serialize() const;

    // Schema inspection
    bool table_exists(const std::string& name);

    /// Column names in declaration order.
    std::vector<std::string> column_names(const std::string& table);

    /// Primary key columns in key order; empty for rowid tables.
    std::vector<std::string> primary_key(const std::string& table);

    // Query - returns rows as column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// First column of the first row, or nullptr when there are no rows.
    column_value_t query_value(const std::string& sql,
                               const std::vector<column_value_t>& params = {});

    /// True when `sql` is a single statement that does not write.
    bool is_read_only(const std::string& sql);

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params. Without params the text may hold
    // several statements.
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows modified by the most recent INSERT/UPDATE/DELETE.
    int64_t changes() const;

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    static column_value_t extract_column(sqlite3_stmt* stmt, int index);

private:
    sqlite3_stmt* prepare(const std::string& sql, const char** tail = nullptr);

    sqlite3* db_ = nullptr;
    std::string path_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

/// Double-quoted SQL identifier.
std::string quote_identifier(const std::string& name);

} // namespace capsync
