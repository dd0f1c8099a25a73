#pragma once

#include "db/connection_pool.hpp"
#include "db/pooled_client.hpp"
#include "driver/driver.hpp"

#include <string>

namespace unisql {

struct PgDriverOptions {
    PoolConfig pool;          // pool.connection_string is a libpq conninfo or URI
    bool pgvector = false;    // vector operations available
    bool postgis = false;     // geospatial operations available
};

/**
 * @brief PostgreSQL adapter over a libpq connection pool
 *
 * Placeholders render as $1, $2, ... and travel to the server through
 * PQexecParams. Each top-level transaction checks out its own connection,
 * so concurrent transactions never share a session. int8 columns come back
 * as text to keep values beyond 2^53 exact; the postgres result parser
 * collapses them for count and exists operations.
 */
class PgDriver : public Driver {
public:
    explicit PgDriver(PgDriverOptions options,
                      InstrumentationOptions instrumentation = {},
                      std::string name = "postgresql");

    ~PgDriver() override;

    [[nodiscard]] const PgDriverOptions& options() const noexcept { return options_; }

protected:
    std::shared_ptr<DriverClient> init_client() override;
    void close_client(DriverClient& client) override;
    QueryResult execute_on(DriverClient& client, const std::string& sql,
                           const Params& params) override;
    std::unique_ptr<TransactionHandle> open_transaction(DriverClient& client) override;

private:
    PgDriverOptions options_;
};

} // namespace unisql
