#pragma once

#include "db/idb_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <utility>

namespace unisql {

class ConnectionPool;

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};   // health-checked after this long idle
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};          // 0 = never recycled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Checked-out connection; goes back to its pool on destruction
 *
 * Move-only. The pool must outlive it.
 */
class PooledConnection {
public:
    using Clock = std::chrono::steady_clock;

    PooledConnection(ConnectionPool& pool, std::unique_ptr<IDbConnection> conn,
                     Clock::time_point created)
        : pool_(&pool), conn_(std::move(conn)), created_(created) {}

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)),
          conn_(std::move(other.conn_)),
          created_(other.created_) {}

    PooledConnection& operator=(PooledConnection&&) = delete;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

private:
    ConnectionPool* pool_;
    std::unique_ptr<IDbConnection> conn_;
    Clock::time_point created_;
};

/**
 * @brief Bounded pool of IDbConnection for one database
 *
 * A counting semaphore caps checked-out plus idle connections at
 * max_connections; idle ones wait in a deque. Connections are created on
 * demand, replaced once older than max_lifetime, and health-checked when
 * they have been idle longer than idle_timeout. Thread-safe.
 */
class ConnectionPool {
public:
    /**
     * @param name Name used in log lines and errors
     * @throws ConnectionError when opening one of the min_connections fails
     */
    ConnectionPool(std::string name, PoolConfig config,
                   std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Check out a connection, waiting up to timeout for a free slot
     * @return nullptr on timeout or after drain()
     * @throws ConnectionError when a new connection cannot be opened
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Close idle connections and refuse new acquisitions
     *
     * Connections still checked out are closed as they come back.
     */
    void drain();

    [[nodiscard]] PoolStats get_stats() const;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

private:
    friend class PooledConnection;
    using Clock = PooledConnection::Clock;

    struct Idle {
        std::unique_ptr<IDbConnection> conn;
        Clock::time_point created;
        Clock::time_point last_used;
    };

    Idle open_connection();
    void close_connection(IDbConnection& conn);

    /// Whether an idle connection may be handed out again
    bool reusable(Idle& idle, Clock::time_point now);

    void release(std::unique_ptr<IDbConnection> conn, Clock::time_point created);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<Idle> idle_;
    std::counting_semaphore<> slots_;
    std::atomic<bool> draining_{false};

    std::atomic<size_t> open_{0};
    std::atomic<size_t> acquires_{0};
    std::atomic<size_t> releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> recycled_{0};
};

} // namespace unisql
