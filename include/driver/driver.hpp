#pragma once

#include "driver/driver_client.hpp"
#include "driver/driver_ops.hpp"
#include "driver/idriver.hpp"
#include "driver/result_parser.hpp"
#include "driver/transaction_plan.hpp"
#include "tracing/instrumentation.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace unisql {

/**
 * @brief Base class for backend adapters
 *
 * Holds everything adapters share:
 * - Lazy client manager: the first call needing a client runs init_client()
 *   once, however many threads ask concurrently. A failed init is not
 *   cached; the next call retries.
 * - Transaction controller: a transaction on the root client opens a new
 *   backend transaction on its own handle; one on a handle nests as a
 *   savepoint. Rollback happens before the error is rethrown. While a
 *   thread is inside a top-level transaction, calls it makes on the driver
 *   itself run on that transaction: statements join it, batches run
 *   sequentially in it and with_transaction() becomes a savepoint. Other
 *   threads keep opening independent transactions.
 * - Batch executor: native batch, else one transaction, else sequential
 *   with a warning.
 * - Instrumentation and the error boundary: any non-DriverError escaping an
 *   adapter hook is wrapped (ConnectionError during connect/disconnect,
 *   QueryError otherwise).
 *
 * Adapters implement the protected hooks and must call shutdown() from
 * their destructor, since close_client() cannot be dispatched from here.
 *
 * Thread-safe.
 */
class Driver : public IDriver, private DriverOps {
public:
    Driver(std::string name,
           Dialect dialect,
           DriverCapabilities capabilities,
           ResultParserChain result_parser = {},
           InstrumentationOptions instrumentation = {},
           std::shared_ptr<DriverClient> client = nullptr);

    ~Driver() override = default;

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    // ========================================================================
    // IDriver
    // ========================================================================

    [[nodiscard]] Dialect dialect() const noexcept override { return dialect_; }
    [[nodiscard]] const std::string& driver_name() const noexcept override { return name_; }
    [[nodiscard]] const DriverCapabilities& capabilities() const noexcept override {
        return capabilities_;
    }
    [[nodiscard]] const ResultParserChain& result_parser() const noexcept override {
        return result_parser_;
    }

    QueryResult execute(const Sql& query) override;
    QueryResult execute_raw(const std::string& sql, const Params& params = {}) override;
    std::vector<QueryResult> execute_batch(const std::vector<BatchQuery>& queries) override;
    void with_transaction(const std::function<void(IDriver&)>& fn,
                          const TransactionOptions& options = {}) override;

    /// Initialize the client now instead of on first use
    void connect() override;

    /**
     * @brief Close the client and reset to the never-connected state
     *
     * New acquisitions fail with ConnectionError while this runs. An
     * initialization in flight is awaited first; if it failed there is
     * nothing to close. A later call initializes a fresh client.
     */
    void disconnect() override;

    void set_context(QueryContext context) override;
    void clear_context() override;
    [[nodiscard]] QueryContext context() const override;

    [[nodiscard]] bool in_transaction() const noexcept override { return false; }

    // ========================================================================
    // Introspection
    // ========================================================================

    /// Transaction and savepoint scopes open right now, across all threads
    [[nodiscard]] int transaction_depth() const noexcept {
        return depth_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_connected() const;

    /// db.system and db.driver
    [[nodiscard]] SpanAttributes base_attributes() const;

    /// base_attributes() plus the current model and operation
    [[nodiscard]] SpanAttributes context_attributes() const;

    /**
     * @brief Throw FeatureNotSupportedError unless an optional extension is on
     * @param feature "vector" or "geospatial"
     */
    void require_feature(std::string_view feature, std::string_view method) const;

protected:
    using TransactionBody = std::function<void(TransactionHandle&)>;

    // ========================================================================
    // Adapter hooks
    // ========================================================================

    [[nodiscard]] virtual std::shared_ptr<DriverClient> init_client() = 0;
    virtual void close_client(DriverClient& client) = 0;

    /// Execute on the root client or on a TransactionHandle from open_transaction()
    virtual QueryResult execute_on(DriverClient& client, const std::string& sql,
                                   const Params& params) = 0;

    virtual QueryResult execute_raw_on(DriverClient& client, const std::string& sql,
                                       const Params& params) {
        return execute_on(client, sql, params);
    }

    /**
     * @brief Run body in a transaction on client
     *
     * The default is the generic controller: a top level on a root client
     * (open_transaction, plan_top_level statements, COMMIT or ROLLBACK) and
     * a savepoint on a TransactionHandle.
     */
    virtual void transaction_on(DriverClient& client, const TransactionBody& body,
                                const TransactionOptions& options);

    /**
     * @brief Dedicated handle a top-level transaction runs on
     *
     * Pooled adapters check out a connection and return it when the handle
     * is destroyed. Required when supports_transactions is set.
     */
    [[nodiscard]] virtual std::unique_ptr<TransactionHandle> open_transaction(DriverClient& client);

    /// Native atomic batch; required when supports_batch is set
    virtual std::vector<QueryResult> execute_batch_on(DriverClient& client,
                                                      const std::vector<BatchQuery>& queries);

    [[nodiscard]] virtual TransactionPlan plan_top_level(const TransactionOptions& options) const {
        return plan_transaction(dialect_, options);
    }

    // ========================================================================
    // Helpers for adapters
    // ========================================================================

    /// Structured warning tagged with the current context
    void warn(std::string message) const;

    /// disconnect() for destructors: failures are logged, never thrown
    void shutdown() noexcept;

    [[nodiscard]] const Instrumentation& instrumentation() const noexcept { return instrumentation_; }

private:
    // DriverOps
    QueryResult run_statement(DriverClient& target, const std::string& sql,
                              const Params& params, bool raw) override;
    std::vector<QueryResult> run_batch(DriverClient& target,
                                       const std::vector<BatchQuery>& queries,
                                       bool bound) override;
    void run_transaction(DriverClient& target,
                         const std::function<void(IDriver&)>& fn,
                         const TransactionOptions& options) override;

    class ActiveTransaction;

    /// Top-level transaction open on the calling thread, or nullptr
    [[nodiscard]] TransactionHandle* active_transaction() const;

    std::shared_ptr<DriverClient> get_client();
    std::shared_ptr<DriverClient> initialize();
    void finish_disconnect();

    void run_top_level(DriverClient& client, const TransactionBody& body,
                       const TransactionOptions& options);
    void run_savepoint(TransactionHandle& handle, const TransactionBody& body,
                       const TransactionOptions& options);
    void control(TransactionHandle& handle, const std::string& sql);
    void rollback_quietly(TransactionHandle& handle, const std::string& sql);
    void reset_quietly(TransactionHandle& handle, const TransactionPlan& plan);
    void transaction_unsupported(const std::function<void(IDriver&)>& fn);

    std::vector<QueryResult> run_sequential(DriverClient& target,
                                            const std::vector<BatchQuery>& queries);
    std::vector<QueryResult> run_native_batch(DriverClient& target,
                                              const std::vector<BatchQuery>& queries,
                                              const QueryContext& context);

    [[nodiscard]] std::string next_savepoint_name();
    [[nodiscard]] QueryLogEvent make_event(const QueryContext& context,
                                           std::string sql = {},
                                           Params params = {}) const;

    const std::string name_;
    const Dialect dialect_;
    const DriverCapabilities capabilities_;
    const ResultParserChain result_parser_;
    const Instrumentation instrumentation_;

    // Lazy client manager state
    mutable std::mutex client_mutex_;
    std::shared_ptr<DriverClient> client_;
    std::optional<std::shared_future<std::shared_ptr<DriverClient>>> pending_;
    bool disconnecting_ = false;

    mutable std::mutex active_mutex_;
    std::unordered_map<std::thread::id, TransactionHandle*> active_;

    std::atomic<int> depth_{0};
    std::atomic<uint64_t> savepoint_counter_{0};

    mutable std::mutex context_mutex_;
    QueryContext context_;
};

} // namespace unisql
