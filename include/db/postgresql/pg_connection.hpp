#pragma once

#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <string>

namespace unisql {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. Parameters travel separately from the SQL text through
 * PQexecParams in text format, so $n placeholders are bound server-side.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const Params& params = {}) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);
    DbResultSet process_error(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory using PQconnectdb
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace unisql
