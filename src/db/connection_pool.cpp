#include "db/connection_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace unisql {

// ============================================================================
// PooledConnection
// ============================================================================

PooledConnection::~PooledConnection() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_), created_);
    }
}

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(std::string name, PoolConfig config,
                               std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      slots_(static_cast<std::ptrdiff_t>(config_.max_connections)) {

    // Opening min_connections up front surfaces a bad connection string at connect()
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto idle = open_connection();
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(idle));
    }

    utils::log::info(std::format("[{}] connection pool ready: {} open (min={}, max={})",
        name_, open_.load(), config_.min_connections, config_.max_connections));
}

ConnectionPool::~ConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (draining_.load(std::memory_order_acquire)) {
        return nullptr;
    }
    if (!slots_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    if (draining_.load(std::memory_order_acquire)) {
        slots_.release();
        return nullptr;
    }
    acquires_.fetch_add(1, std::memory_order_relaxed);

    const auto now = Clock::now();
    try {
        for (;;) {
            Idle idle;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (idle_.empty()) break;
                idle = std::move(idle_.front());
                idle_.pop_front();
            }
            if (reusable(idle, now)) {
                return std::make_unique<PooledConnection>(*this, std::move(idle.conn), idle.created);
            }
        }
        auto fresh = open_connection();
        return std::make_unique<PooledConnection>(*this, std::move(fresh.conn), fresh.created);
    } catch (...) {
        slots_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

bool ConnectionPool::reusable(Idle& idle, Clock::time_point now) {
    if (config_.max_lifetime.count() > 0 && now - idle.created > config_.max_lifetime) {
        close_connection(*idle.conn);
        recycled_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    // Only long-idle connections pay for a health check round trip
    if (now - idle.last_used > config_.idle_timeout &&
        !idle.conn->is_healthy(config_.health_check_query)) {
        close_connection(*idle.conn);
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void ConnectionPool::release(std::unique_ptr<IDbConnection> conn, Clock::time_point created) {
    releases_.fetch_add(1, std::memory_order_relaxed);

    if (draining_.load(std::memory_order_acquire) || !conn->is_connected()) {
        close_connection(*conn);
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(Idle{std::move(conn), created, Clock::now()});
    }
    slots_.release();
}

void ConnectionPool::drain() {
    if (draining_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<Idle> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(idle_);
    }
    for (auto& idle : closing) {
        close_connection(*idle.conn);
    }
    utils::log::info(std::format("[{}] connection pool drained", name_));
}

PoolStats ConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.idle_connections = idle_.size();
    }
    stats.total_connections = open_.load(std::memory_order_relaxed);
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = acquires_.load(std::memory_order_relaxed);
    stats.total_releases = releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = recycled_.load(std::memory_order_relaxed);
    return stats;
}

ConnectionPool::Idle ConnectionPool::open_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        throw ConnectionError(std::format("[{}] connection factory returned no connection", name_));
    }
    open_.fetch_add(1, std::memory_order_relaxed);
    const auto now = Clock::now();
    return Idle{std::move(conn), now, now};
}

void ConnectionPool::close_connection(IDbConnection& conn) {
    conn.close();
    open_.fetch_sub(1, std::memory_order_relaxed);
}

} // namespace unisql
