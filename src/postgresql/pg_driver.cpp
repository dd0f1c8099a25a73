#include "postgresql/pg_driver.hpp"
#include "db/error_translation.hpp"
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"

namespace unisql {

namespace {

DriverCapabilities pg_capabilities(const PgDriverOptions& options) {
    DriverCapabilities caps;
    caps.supports_transactions = true;
    caps.supports_batch = false;
    caps.supports_vector = options.pgvector;
    caps.supports_geospatial = options.postgis;
    return caps;
}

} // namespace

PgDriver::PgDriver(PgDriverOptions options,
                   InstrumentationOptions instrumentation,
                   std::string name)
    : Driver(std::move(name), Dialect::POSTGRESQL, pg_capabilities(options),
             postgres_result_parser(), std::move(instrumentation)),
      options_(std::move(options)) {}

PgDriver::~PgDriver() {
    shutdown();
}

std::shared_ptr<DriverClient> PgDriver::init_client() {
    auto pool = std::make_shared<ConnectionPool>(
        driver_name(), options_.pool, std::make_shared<PgConnectionFactory>());
    return std::make_shared<PooledClient>(std::move(pool), options_.pool.acquire_timeout);
}

void PgDriver::close_client(DriverClient& client) {
    if (auto* root = dynamic_cast<PooledClient*>(&client)) {
        root->pool()->drain();
    }
}

QueryResult PgDriver::execute_on(DriverClient& client, const std::string& sql,
                                 const Params& params) {
    return with_pooled_connection(client, [&](IDbConnection& conn) {
        auto rs = conn.execute(sql, params);
        if (!rs.success) {
            translate_pg_error(rs.error, sql, params);
        }
        return std::move(rs).to_query_result();
    });
}

std::unique_ptr<TransactionHandle> PgDriver::open_transaction(DriverClient& client) {
    auto* root = dynamic_cast<PooledClient*>(&client);
    if (!root) {
        throw DriverError("postgresql driver received a client it did not create");
    }
    return std::make_unique<PooledTransaction>(*root);
}

} // namespace unisql
