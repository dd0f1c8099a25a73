#pragma once

#include "db/connection_pool.hpp"
#include "core/error.hpp"
#include "driver/driver_client.hpp"

#include <chrono>
#include <memory>

namespace unisql {

/**
 * @brief Driver client for pooled engines: owns the connection pool
 *
 * Standalone statements borrow a connection for one statement. Every
 * top-level transaction checks out its own connection through a
 * PooledTransaction, independent of other transactions.
 */
class PooledClient : public DriverClient {
public:
    PooledClient(std::shared_ptr<ConnectionPool> pool,
                 std::chrono::milliseconds acquire_timeout)
        : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

    [[nodiscard]] const std::shared_ptr<ConnectionPool>& pool() const noexcept { return pool_; }

    /**
     * @brief Check out a connection
     * @throws ConnectionError on timeout or once the pool is drained
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire() const;

private:
    std::shared_ptr<ConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
};

/**
 * @brief Transaction handle pinned to one checked-out connection
 *
 * The connection goes back to the pool when the handle is destroyed. The
 * handle keeps the pool alive until then.
 */
class PooledTransaction : public TransactionHandle {
public:
    explicit PooledTransaction(const PooledClient& client)
        : pool_(client.pool()), connection_(client.acquire()) {}

    [[nodiscard]] IDbConnection& connection() const noexcept { return *connection_->get(); }

private:
    std::shared_ptr<ConnectionPool> pool_;   // destroyed after connection_
    std::unique_ptr<PooledConnection> connection_;
};

/**
 * @brief Run fn with the connection a statement should use on client
 *
 * A PooledTransaction target uses its pinned connection; a PooledClient
 * target borrows one for the duration of fn.
 */
template <typename Fn>
auto with_pooled_connection(DriverClient& client, Fn&& fn) {
    if (auto* tx = dynamic_cast<PooledTransaction*>(&client)) {
        return fn(tx->connection());
    }
    auto* root = dynamic_cast<PooledClient*>(&client);
    if (!root) {
        throw DriverError("pooled driver received a client it did not create");
    }
    auto conn = root->acquire();
    return fn(*conn->get());
}

} // namespace unisql
