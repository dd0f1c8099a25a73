#pragma once

#include "db/idb_connection.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace unisql {

struct SqliteOptions {
    std::string filename{":memory:"};
    bool read_only = false;
    std::chrono::milliseconds busy_timeout{5000};
    bool foreign_keys = true;
};

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3*. Statements are prepared with sqlite3_prepare_v2 and '?'
 * parameters bound natively (booleans as 1/0). A multi-statement script
 * runs statement by statement, each consuming its share of the parameters;
 * the last statement's result is returned.
 *
 * Not thread-safe: the owning driver serializes access.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open handle (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql, const Params& params = {}) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    DbResultSet step_statement(sqlite3_stmt* stmt);
    DbResultSet failure(int rc);

    sqlite3* db_;
};

/**
 * @brief Opens SqliteConnection instances with sqlite3_open_v2
 *
 * A non-empty connection string overrides options.filename.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    explicit SqliteConnectionFactory(SqliteOptions options = {})
        : options_(std::move(options)) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

private:
    SqliteOptions options_;
};

/**
 * @brief Name of a SQLite result code, extended code first
 * (e.g. "SQLITE_CONSTRAINT_UNIQUE", "SQLITE_BUSY")
 */
[[nodiscard]] std::string sqlite_code_name(int extended_code);

/// Generic type from a declared column type, using SQLite's affinity rules
[[nodiscard]] GenericColumnType sqlite_decltype_to_generic(const char* decl_type);

} // namespace unisql
