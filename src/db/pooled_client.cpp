#include "db/pooled_client.hpp"
#include "core/error.hpp"

#include <format>

namespace unisql {

std::unique_ptr<PooledConnection> PooledClient::acquire() const {
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        throw ConnectionError(std::format("[{}] no connection available within {}ms",
                                          pool_->name(), acquire_timeout_.count()));
    }
    return conn;
}

} // namespace unisql
