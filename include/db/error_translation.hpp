#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <string>

namespace unisql {

// ============================================================================
// Backend error translation
//
// Each function throws the DriverError subtype matching the backend's
// diagnostics: ConnectionError for connection-class codes, the constraint
// subtypes for unique / foreign-key violations, QueryError otherwise.
// ============================================================================

/**
 * @brief PostgreSQL: by SQLSTATE
 *
 * 23505 unique (columns parsed from "Key (a, b)=(...)" detail), 23503
 * foreign key, class 08 / 28xxx / 57P01-57P03 / 53300 connection.
 */
[[noreturn]] void translate_pg_error(const BackendError& error,
                                     const std::string& sql, const Params& params);

/**
 * @brief MySQL: by errno
 *
 * 1062 unique (table and constraint from "for key 'table.name'"),
 * 1451/1452 foreign key, 2002/2003/2006/2013 and 1040/1045 connection.
 */
[[noreturn]] void translate_mysql_error(const BackendError& error,
                                        const std::string& sql, const Params& params);

/**
 * @brief SQLite: by result code name
 *
 * SQLITE_CONSTRAINT_UNIQUE / _PRIMARYKEY unique (table and columns from
 * "UNIQUE constraint failed: t.a, t.b"), SQLITE_CONSTRAINT_FOREIGNKEY
 * foreign key, SQLITE_CANTOPEN / SQLITE_NOTADB connection.
 */
[[noreturn]] void translate_sqlite_error(const BackendError& error,
                                         const std::string& sql, const Params& params);

/**
 * @brief Error text from a SQLite-compatible service that reports no code
 *
 * Infers the SQLite code from the message, then translate_sqlite_error().
 */
[[noreturn]] void translate_sqlite_message(const std::string& message,
                                           const std::string& sql, const Params& params);

} // namespace unisql
