#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access (for inspection tools)
    };

    explicit database(const std::string& path,
                      open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Schema inspection
    bool table_exists(const std::string& name);

    // Columns of `table` in declaration order (PRAGMA table_info)
    std::vector<column_info> get_columns(const std::string& table);

    // CRUD operations
    primary_key_t insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values);

    void update(const std::string& table,
                primary_key_t id,
                const std::vector<std::pair<std::string, column_value_t>>& values);

    void remove(const std::string& table, primary_key_t id);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params (for DDL and INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // Transaction support. Exclusive transactions are used for migrations.
    void begin_transaction(bool exclusive = false);
    void commit();
    void rollback();
    bool is_in_transaction();

    /// Serializes use of the shared connection. Recursive: a thread holding a
    /// transaction may issue further statements.
    std::unique_lock<std::recursive_mutex> lock() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    std::recursive_mutex mutex_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII transaction guard. Holds the connection lock until commit/rollback.
class transaction {
public:
    explicit transaction(database& db, bool exclusive = false);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool completed_ = false;
};

} // namespace strata
