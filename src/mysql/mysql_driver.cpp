#include "mysql/mysql_driver.hpp"
#include "db/error_translation.hpp"
#include "db/connection_pool.hpp"
#include "db/mysql/mysql_connection.hpp"

namespace unisql {

namespace {

DriverCapabilities mysql_capabilities() {
    DriverCapabilities caps;
    caps.supports_transactions = true;
    caps.supports_batch = false;
    return caps;
}

} // namespace

MysqlDriver::MysqlDriver(MysqlDriverOptions options,
                         InstrumentationOptions instrumentation,
                         std::string name)
    : Driver(std::move(name), Dialect::MYSQL, mysql_capabilities(),
             mysql_result_parser(), std::move(instrumentation)),
      options_(std::move(options)) {}

MysqlDriver::~MysqlDriver() {
    shutdown();
}

std::shared_ptr<DriverClient> MysqlDriver::init_client() {
    auto pool = std::make_shared<ConnectionPool>(
        driver_name(), options_.pool, std::make_shared<MysqlConnectionFactory>());
    return std::make_shared<PooledClient>(std::move(pool), options_.pool.acquire_timeout);
}

void MysqlDriver::close_client(DriverClient& client) {
    if (auto* root = dynamic_cast<PooledClient*>(&client)) {
        root->pool()->drain();
    }
}

QueryResult MysqlDriver::execute_on(DriverClient& client, const std::string& sql,
                                    const Params& params) {
    return with_pooled_connection(client, [&](IDbConnection& conn) {
        auto rs = conn.execute(sql, params);
        if (!rs.success) {
            translate_mysql_error(rs.error, sql, params);
        }
        return std::move(rs).to_query_result();
    });
}

std::unique_ptr<TransactionHandle> MysqlDriver::open_transaction(DriverClient& client) {
    auto* root = dynamic_cast<PooledClient*>(&client);
    if (!root) {
        throw DriverError("mysql driver received a client it did not create");
    }
    return std::make_unique<PooledTransaction>(*root);
}

} // namespace unisql
