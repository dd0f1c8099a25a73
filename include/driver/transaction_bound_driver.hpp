#pragma once

#include "driver/driver_client.hpp"
#include "driver/driver_ops.hpp"
#include "driver/idriver.hpp"

namespace unisql {

/**
 * @brief Driver view pinned to one open transaction
 *
 * Statements run on the bound handle and never trigger lazy
 * initialization. disconnect() is a no-op since the parent owns the
 * connection, and a nested transaction becomes a savepoint. Valid only
 * for the duration of the transaction callback it was handed to.
 */
class TransactionBoundDriver : public IDriver {
public:
    TransactionBoundDriver(IDriver& parent, DriverOps& ops, TransactionHandle& handle)
        : parent_(parent), ops_(ops), handle_(handle) {}

    [[nodiscard]] Dialect dialect() const noexcept override { return parent_.dialect(); }
    [[nodiscard]] const std::string& driver_name() const noexcept override {
        return parent_.driver_name();
    }
    [[nodiscard]] const DriverCapabilities& capabilities() const noexcept override {
        return parent_.capabilities();
    }
    [[nodiscard]] const ResultParserChain& result_parser() const noexcept override {
        return parent_.result_parser();
    }

    QueryResult execute(const Sql& query) override;
    QueryResult execute_raw(const std::string& sql, const Params& params = {}) override;
    std::vector<QueryResult> execute_batch(const std::vector<BatchQuery>& queries) override;
    void with_transaction(const std::function<void(IDriver&)>& fn,
                          const TransactionOptions& options = {}) override;

    void connect() override {}
    void disconnect() override {}

    void set_context(QueryContext context) override { parent_.set_context(std::move(context)); }
    void clear_context() override { parent_.clear_context(); }
    [[nodiscard]] QueryContext context() const override { return parent_.context(); }

    [[nodiscard]] bool in_transaction() const noexcept override { return true; }

    /// Open scopes on the bound handle (1 at the top level)
    [[nodiscard]] int depth() const noexcept { return handle_.depth(); }

private:
    IDriver& parent_;
    DriverOps& ops_;
    TransactionHandle& handle_;
};

} // namespace unisql
