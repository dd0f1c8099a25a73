#pragma once

#include "db/sqlite/sqlite_connection.hpp"
#include "driver/driver.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace unisql {

/**
 * @brief Embedded database client: one connection behind a recursive lock
 */
class SqliteClient : public DriverClient {
public:
    explicit SqliteClient(std::unique_ptr<IDbConnection> connection)
        : connection_(std::move(connection)) {}

    [[nodiscard]] std::recursive_mutex& mutex() noexcept { return mutex_; }
    [[nodiscard]] IDbConnection& connection() noexcept { return *connection_; }

private:
    std::recursive_mutex mutex_;
    std::unique_ptr<IDbConnection> connection_;
};

/**
 * @brief SQLite adapter (sqlite3 C API, synchronous)
 *
 * A top-level transaction holds the client lock for its whole lifetime,
 * so statements from other threads wait until it commits or rolls back.
 * Transactions are always SERIALIZABLE; a transaction timeout becomes the
 * busy timeout for the duration of the transaction.
 */
class SqliteDriver : public Driver {
public:
    explicit SqliteDriver(SqliteOptions options = {},
                          InstrumentationOptions instrumentation = {},
                          std::string name = "sqlite");

    /**
     * @brief Adopt an already opened connection instead of opening lazily
     *
     * disconnect() closes it.
     */
    SqliteDriver(std::unique_ptr<IDbConnection> connection,
                 InstrumentationOptions instrumentation = {},
                 std::string name = "sqlite");

    ~SqliteDriver() override;

    [[nodiscard]] const SqliteOptions& options() const noexcept { return options_; }

protected:
    std::shared_ptr<DriverClient> init_client() override;
    void close_client(DriverClient& client) override;
    QueryResult execute_on(DriverClient& client, const std::string& sql,
                           const Params& params) override;
    std::unique_ptr<TransactionHandle> open_transaction(DriverClient& client) override;
    TransactionPlan plan_top_level(const TransactionOptions& options) const override;

private:
    SqliteOptions options_;
};

} // namespace unisql
