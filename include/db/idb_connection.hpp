#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace unisql {

/**
 * @brief Diagnostics reported by the backend for a failed statement
 *
 * Fields the backend does not provide stay empty.
 */
struct BackendError {
    std::string message;
    std::string code;           // SQLSTATE, MySQL errno as text, SQLite code name
    int native_code = 0;        // MySQL errno / SQLite extended result code
    std::string constraint;
    std::string table;
    std::string column;
    std::string detail;
};

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    BackendError error;

    // For statements returning rows
    std::vector<std::string> column_names;
    std::vector<GenericColumnType> column_types;
    std::vector<std::vector<Value>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // Rows vs DML/DDL
    bool has_rows = false;

    /// row_count is rows.size() for row sets, affected_rows otherwise
    [[nodiscard]] QueryResult to_query_result() &&;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, sqlite3*).
 * Implementations are not thread-safe; thread safety comes from the pool
 * or from the owning client's lock.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one statement with positional parameters
     * @param sql SQL text in the backend's placeholder syntax
     * @return Result set; success=false carries the backend diagnostics
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const Params& params = {}) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    virtual void close() = 0;
};

/**
 * @brief Opens connections for a pool; one per backend
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /// @throws ConnectionError carrying the backend's reason
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace unisql
