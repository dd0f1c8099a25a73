#pragma once

#include <atomic>

namespace unisql {

/**
 * @brief Opaque backend client owned by a Driver
 *
 * Adapters derive their own client type (a pool, an embedded database
 * handle, an HTTP endpoint) and downcast it in their hooks.
 */
class DriverClient {
public:
    virtual ~DriverClient() = default;

protected:
    DriverClient() = default;
    DriverClient(const DriverClient&) = delete;
    DriverClient& operator=(const DriverClient&) = delete;
};

/**
 * @brief Client pinned to one open backend transaction
 *
 * Statements executed against a handle run inside its transaction. A
 * transaction requested on a handle nests as a savepoint. depth() counts
 * the open scopes on this handle (1 while only the top level is open).
 */
class TransactionHandle : public DriverClient {
public:
    [[nodiscard]] int depth() const noexcept { return depth_.load(std::memory_order_acquire); }

    void enter() noexcept { depth_.fetch_add(1, std::memory_order_acq_rel); }
    void leave() noexcept { depth_.fetch_sub(1, std::memory_order_acq_rel); }

private:
    std::atomic<int> depth_{0};
};

} // namespace unisql
