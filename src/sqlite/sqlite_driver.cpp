#include "sqlite/sqlite_driver.hpp"
#include "db/error_translation.hpp"


namespace unisql {

namespace {

DriverCapabilities sqlite_capabilities() {
    DriverCapabilities caps;
    caps.supports_transactions = true;
    caps.supports_batch = false;
    return caps;
}

/**
 * @brief Handle of an open transaction; owns the client lock until destroyed
 */
class SqliteTransaction : public TransactionHandle {
public:
    explicit SqliteTransaction(SqliteClient& client)
        : client_(client), lock_(client.mutex()) {}

    [[nodiscard]] SqliteClient& client() noexcept { return client_; }

private:
    SqliteClient& client_;
    std::unique_lock<std::recursive_mutex> lock_;
};

SqliteClient& resolve(DriverClient& client) {
    if (auto* tx = dynamic_cast<SqliteTransaction*>(&client)) {
        return tx->client();
    }
    if (auto* root = dynamic_cast<SqliteClient*>(&client)) {
        return *root;
    }
    throw DriverError("sqlite driver received a client it did not create");
}

} // namespace

SqliteDriver::SqliteDriver(SqliteOptions options,
                           InstrumentationOptions instrumentation,
                           std::string name)
    : Driver(std::move(name), Dialect::SQLITE, sqlite_capabilities(),
             sqlite_result_parser(), std::move(instrumentation)),
      options_(std::move(options)) {}

SqliteDriver::SqliteDriver(std::unique_ptr<IDbConnection> connection,
                           InstrumentationOptions instrumentation,
                           std::string name)
    : Driver(std::move(name), Dialect::SQLITE, sqlite_capabilities(),
             sqlite_result_parser(), std::move(instrumentation),
             std::make_shared<SqliteClient>(std::move(connection))) {}

SqliteDriver::~SqliteDriver() {
    shutdown();
}

std::shared_ptr<DriverClient> SqliteDriver::init_client() {
    SqliteConnectionFactory factory(options_);
    return std::make_shared<SqliteClient>(factory.create(options_.filename));
}

void SqliteDriver::close_client(DriverClient& client) {
    auto& sqlite = resolve(client);
    std::lock_guard<std::recursive_mutex> lock(sqlite.mutex());
    sqlite.connection().close();
}

QueryResult SqliteDriver::execute_on(DriverClient& client, const std::string& sql,
                                     const Params& params) {
    auto& sqlite = resolve(client);
    std::lock_guard<std::recursive_mutex> lock(sqlite.mutex());
    auto rs = sqlite.connection().execute(sql, params);
    if (!rs.success) {
        translate_sqlite_error(rs.error, sql, params);
    }
    return std::move(rs).to_query_result();
}

std::unique_ptr<TransactionHandle> SqliteDriver::open_transaction(DriverClient& client) {
    return std::make_unique<SqliteTransaction>(resolve(client));
}

TransactionPlan SqliteDriver::plan_top_level(const TransactionOptions& options) const {
    return plan_transaction(Dialect::SQLITE, options, options_.busy_timeout);
}

} // namespace unisql
