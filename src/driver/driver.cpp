#include "driver/driver.hpp"
#include "driver/transaction_bound_driver.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <thread>

namespace unisql {

namespace {

// Error boundary around adapter hooks: backend-native exceptions never
// cross it unwrapped.
template <typename Fn>
auto guard_query(std::string_view driver, const std::string& sql, const Params& params, Fn&& fn)
    -> std::invoke_result_t<Fn&> {
    try {
        return fn();
    } catch (const DriverError&) {
        throw;
    } catch (const std::exception& e) {
        throw QueryError(std::format("[{}] query failed: {}", driver, e.what()),
                         sql, params, {}, std::current_exception(), e.what());
    }
}

template <typename Fn>
auto guard_connection(std::string_view driver, std::string_view action, Fn&& fn)
    -> std::invoke_result_t<Fn&> {
    try {
        return fn();
    } catch (const DriverError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConnectionError(std::format("[{}] {} failed: {}", driver, action, e.what()),
                              {}, std::current_exception(), e.what());
    }
}

/**
 * @brief Counts one open transaction scope on the driver and on the handle
 *
 * The driver counter never goes below zero: disconnect() may have reset
 * it while the scope was open.
 */
class ScopeDepth {
public:
    ScopeDepth(std::atomic<int>& driver_depth, TransactionHandle& handle)
        : driver_depth_(driver_depth), handle_(handle) {
        driver_depth_.fetch_add(1, std::memory_order_acq_rel);
        handle_.enter();
    }

    ~ScopeDepth() {
        handle_.leave();
        int current = driver_depth_.load(std::memory_order_acquire);
        while (current > 0 &&
               !driver_depth_.compare_exchange_weak(current, current - 1,
                                                    std::memory_order_acq_rel)) {
        }
    }

    ScopeDepth(const ScopeDepth&) = delete;
    ScopeDepth& operator=(const ScopeDepth&) = delete;

private:
    std::atomic<int>& driver_depth_;
    TransactionHandle& handle_;
};

std::string batch_log_text(const std::vector<BatchQuery>& queries) {
    std::string text;
    for (const auto& q : queries) {
        if (!text.empty()) text += "; ";
        text += q.sql;
    }
    return text;
}

} // namespace

/**
 * @brief Registers a top-level transaction as the calling thread's active one
 *
 * Destroyed before the handle it registers.
 */
class Driver::ActiveTransaction {
public:
    ActiveTransaction(Driver& driver, TransactionHandle& handle)
        : driver_(driver), thread_(std::this_thread::get_id()) {
        std::lock_guard<std::mutex> lock(driver_.active_mutex_);
        auto& slot = driver_.active_[thread_];
        previous_ = slot;
        slot = &handle;
    }

    ~ActiveTransaction() {
        std::lock_guard<std::mutex> lock(driver_.active_mutex_);
        if (previous_) {
            driver_.active_[thread_] = previous_;
        } else {
            driver_.active_.erase(thread_);
        }
    }

    ActiveTransaction(const ActiveTransaction&) = delete;
    ActiveTransaction& operator=(const ActiveTransaction&) = delete;

private:
    Driver& driver_;
    std::thread::id thread_;
    TransactionHandle* previous_ = nullptr;
};

// ============================================================================
// Construction
// ============================================================================

Driver::Driver(std::string name,
               Dialect dialect,
               DriverCapabilities capabilities,
               ResultParserChain result_parser,
               InstrumentationOptions instrumentation,
               std::shared_ptr<DriverClient> client)
    : name_(std::move(name)),
      dialect_(dialect),
      capabilities_(capabilities),
      result_parser_(std::move(result_parser)),
      instrumentation_(std::move(instrumentation)),
      client_(std::move(client)) {}

// ============================================================================
// Lazy client manager
// ============================================================================

TransactionHandle* Driver::active_transaction() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    const auto it = active_.find(std::this_thread::get_id());
    return it != active_.end() ? it->second : nullptr;
}

std::shared_ptr<DriverClient> Driver::get_client() {
    std::promise<std::shared_ptr<DriverClient>> promise;
    std::shared_future<std::shared_ptr<DriverClient>> waiter;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (disconnecting_) {
            throw ConnectionError(std::format("[{}] driver is disconnecting", name_));
        }
        if (client_) return client_;
        if (pending_) {
            waiter = *pending_;
        } else {
            pending_ = promise.get_future().share();
        }
    }

    if (waiter.valid()) {
        // Another caller is initializing: share its outcome
        return waiter.get();
    }

    try {
        auto client = initialize();
        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            client_ = client;
            pending_.reset();
        }
        promise.set_value(client);
        return client;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            pending_.reset();
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::shared_ptr<DriverClient> Driver::initialize() {
    return instrumentation_.traced("unisql.connect", base_attributes(), [&] {
        return instrumentation_.logged(make_event(context()), [&] {
            auto client = guard_connection(name_, "connect", [&] { return init_client(); });
            if (!client) {
                throw ConnectionError(std::format("[{}] connect failed: no client was created", name_));
            }
            return client;
        });
    });
}

void Driver::connect() {
    (void)get_client();
}

bool Driver::is_connected() const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    return client_ != nullptr;
}

void Driver::disconnect() {
    std::optional<std::shared_future<std::shared_ptr<DriverClient>>> pending;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (disconnecting_) return;
        if (!client_ && !pending_) {
            depth_.store(0, std::memory_order_release);
            return;
        }
        disconnecting_ = true;
        pending = pending_;
    }

    // A failed init leaves client_ empty; wait() does not rethrow
    if (pending) pending->wait();

    std::shared_ptr<DriverClient> client;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client = std::move(client_);
        client_.reset();
    }

    if (client) {
        try {
            instrumentation_.traced("unisql.disconnect", base_attributes(), [&] {
                instrumentation_.logged(make_event(context()), [&] {
                    guard_connection(name_, "disconnect", [&] { close_client(*client); });
                });
            });
        } catch (...) {
            finish_disconnect();
            throw;
        }
    }
    finish_disconnect();
}

void Driver::finish_disconnect() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_.reset();
    pending_.reset();
    depth_.store(0, std::memory_order_release);
    disconnecting_ = false;
}

void Driver::shutdown() noexcept {
    try {
        disconnect();
    } catch (const std::exception& e) {
        utils::log::error(std::format("[unisql:{}] disconnect during shutdown failed: {}",
                                      name_, e.what()));
    }
}

// ============================================================================
// Context and attributes
// ============================================================================

void Driver::set_context(QueryContext context) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    context_ = std::move(context);
}

void Driver::clear_context() {
    std::lock_guard<std::mutex> lock(context_mutex_);
    context_ = QueryContext{};
}

QueryContext Driver::context() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return context_;
}

SpanAttributes Driver::base_attributes() const {
    return instrumentation_.attributes(dialect_, name_, QueryContext{});
}

SpanAttributes Driver::context_attributes() const {
    return instrumentation_.attributes(dialect_, name_, context());
}

void Driver::require_feature(std::string_view feature, std::string_view method) const {
    const bool postgres = dialect_ == Dialect::POSTGRESQL;
    if (feature == "vector") {
        if (capabilities_.supports_vector) return;
        throw FeatureNotSupportedError(std::string(feature), std::string(method),
                                       postgres ? "Load the pgvector extension." : "");
    }
    if (feature == "geospatial") {
        if (capabilities_.supports_geospatial) return;
        throw FeatureNotSupportedError(std::string(feature), std::string(method),
                                       postgres ? "Load the PostGIS extension." : "");
    }
    throw FeatureNotSupportedError(std::string(feature), std::string(method));
}

void Driver::warn(std::string message) const {
    instrumentation_.warn(name_, context(), std::move(message));
}

QueryLogEvent Driver::make_event(const QueryContext& context, std::string sql, Params params) const {
    QueryLogEvent event;
    event.driver = name_;
    event.model = context.model;
    event.operation = context.operation;
    event.sql = std::move(sql);
    event.params = std::move(params);
    return event;
}

// ============================================================================
// Statements
// ============================================================================

QueryResult Driver::execute(const Sql& query) {
    auto stmt = query.to_statement(dialect_);
    if (auto* handle = active_transaction()) {
        return run_statement(*handle, stmt.sql, stmt.params, false);
    }
    auto client = get_client();
    return run_statement(*client, stmt.sql, stmt.params, false);
}

QueryResult Driver::execute_raw(const std::string& sql, const Params& params) {
    if (auto* handle = active_transaction()) {
        return run_statement(*handle, sql, params, true);
    }
    auto client = get_client();
    return run_statement(*client, sql, params, true);
}

QueryResult Driver::run_statement(DriverClient& target, const std::string& sql,
                                  const Params& params, bool raw) {
    const auto ctx = context();
    return instrumentation_.traced(
        "unisql.execute",
        instrumentation_.query_attributes(dialect_, name_, ctx, sql, params),
        [&] {
            return instrumentation_.logged(make_event(ctx, sql, params), [&] {
                return guard_query(name_, sql, params, [&] {
                    auto result = raw ? execute_raw_on(target, sql, params)
                                      : execute_on(target, sql, params);
                    if (!raw && ctx.operation != Operation::NONE && !result_parser_.empty()) {
                        result = result_parser_.parse_result(std::move(result), ctx.operation);
                    }
                    return result;
                });
            });
        });
}

// ============================================================================
// Batch executor
// ============================================================================

std::vector<QueryResult> Driver::execute_batch(const std::vector<BatchQuery>& queries) {
    if (queries.empty()) return {};
    if (auto* handle = active_transaction()) {
        return run_batch(*handle, queries, true);
    }
    auto client = get_client();
    return run_batch(*client, queries, false);
}

std::vector<QueryResult> Driver::run_batch(DriverClient& target,
                                           const std::vector<BatchQuery>& queries,
                                           bool bound) {
    const auto ctx = context();
    auto attrs = instrumentation_.attributes(dialect_, name_, ctx);
    attrs["db.operation.batch.size"] = std::to_string(queries.size());

    return instrumentation_.traced("unisql.batch", std::move(attrs),
                                   [&]() -> std::vector<QueryResult> {
        // Inside a transaction the enclosing transaction provides atomicity
        if (bound) {
            return run_sequential(target, queries);
        }
        if (capabilities_.supports_batch) {
            return run_native_batch(target, queries, ctx);
        }
        if (capabilities_.supports_transactions) {
            std::vector<QueryResult> results;
            run_transaction(target, [&](IDriver& tx) {
                results.clear();
                results.reserve(queries.size());
                for (const auto& q : queries) {
                    results.push_back(tx.execute_raw(q.sql, q.params));
                }
            }, TransactionOptions{});
            return results;
        }
        warn(std::format("executing a batch of {} statements sequentially without a transaction; "
                         "a failure leaves earlier statements committed", queries.size()));
        return run_sequential(target, queries);
    });
}

std::vector<QueryResult> Driver::run_sequential(DriverClient& target,
                                                const std::vector<BatchQuery>& queries) {
    std::vector<QueryResult> results;
    results.reserve(queries.size());
    for (const auto& q : queries) {
        results.push_back(run_statement(target, q.sql, q.params, true));
    }
    return results;
}

std::vector<QueryResult> Driver::run_native_batch(DriverClient& target,
                                                  const std::vector<BatchQuery>& queries,
                                                  const QueryContext& context) {
    const auto text = batch_log_text(queries);
    Params all_params;
    for (const auto& q : queries) {
        all_params.insert(all_params.end(), q.params.begin(), q.params.end());
    }

    return instrumentation_.logged(make_event(context, text, all_params), [&] {
        auto results = guard_query(name_, text, all_params,
                                   [&] { return execute_batch_on(target, queries); });
        if (results.size() != queries.size()) {
            throw QueryError(std::format("[{}] native batch returned {} results for {} statements",
                                         name_, results.size(), queries.size()),
                             text, all_params);
        }
        return results;
    });
}

std::vector<QueryResult> Driver::execute_batch_on(DriverClient&, const std::vector<BatchQuery>&) {
    throw FeatureNotSupportedError("batch", "execute_batch");
}

// ============================================================================
// Transaction controller
// ============================================================================

void Driver::with_transaction(const std::function<void(IDriver&)>& fn,
                              const TransactionOptions& options) {
    if (!capabilities_.supports_transactions) {
        transaction_unsupported(fn);
        return;
    }
    if (auto* handle = active_transaction()) {
        run_transaction(*handle, fn, options);
        return;
    }
    auto client = get_client();
    run_transaction(*client, fn, options);
}

void Driver::transaction_unsupported(const std::function<void(IDriver&)>& fn) {
    if (capabilities_.transaction_fallback == TransactionFallback::REJECT) {
        instrumentation_.logged(make_event(context()), [] {
            throw FeatureNotSupportedError(
                "transaction", "with_transaction",
                "Use execute_batch for atomic multi-statement writes.");
        });
        return;
    }
    warn("driver does not support transactions; running the callback without isolation");
    fn(*this);
}

void Driver::run_transaction(DriverClient& target,
                             const std::function<void(IDriver&)>& fn,
                             const TransactionOptions& options) {
    const auto ctx = context();
    const bool nested = dynamic_cast<TransactionHandle*>(&target) != nullptr;

    auto attrs = instrumentation_.attributes(dialect_, name_, ctx);
    attrs["db.transaction.nested"] = utils::booltostr(nested);
    if (options.isolation_level && !nested) {
        attrs["db.transaction.isolation_level"] =
            std::string(isolation_level_to_sql(*options.isolation_level));
    }

    instrumentation_.traced("unisql.transaction", std::move(attrs), [&] {
        instrumentation_.logged(make_event(ctx), [&] {
            transaction_on(target, [&](TransactionHandle& handle) {
                TransactionBoundDriver view(*this, *this, handle);
                fn(view);
            }, options);
        });
    });
}

void Driver::transaction_on(DriverClient& client, const TransactionBody& body,
                            const TransactionOptions& options) {
    if (auto* handle = dynamic_cast<TransactionHandle*>(&client)) {
        run_savepoint(*handle, body, options);
    } else {
        run_top_level(client, body, options);
    }
}

std::unique_ptr<TransactionHandle> Driver::open_transaction(DriverClient&) {
    throw FeatureNotSupportedError("transaction", "open_transaction");
}

void Driver::run_top_level(DriverClient& client, const TransactionBody& body,
                           const TransactionOptions& options) {
    const auto plan = plan_top_level(options);
    for (const auto& warning : plan.warnings) {
        warn(warning);
    }

    auto handle = guard_connection(name_, "open transaction",
                                   [&] { return open_transaction(client); });
    ScopeDepth scope(depth_, *handle);
    ActiveTransaction active(*this, *handle);

    std::size_t ran = 0;
    try {
        for (const auto& stmt : plan.begin) {
            control(*handle, stmt);
            ++ran;
        }
    } catch (const std::exception& e) {
        if (ran > plan.open_index) {
            rollback_quietly(*handle, "ROLLBACK");
        }
        reset_quietly(*handle, plan);
        const auto* de = dynamic_cast<const DriverError*>(&e);
        throw TransactionError(std::format("[{}] failed to begin transaction: {}", name_, e.what()),
                               de ? de->code() : std::string{}, std::current_exception(), e.what());
    }

    try {
        body(*handle);
    } catch (...) {
        rollback_quietly(*handle, "ROLLBACK");
        reset_quietly(*handle, plan);
        throw;
    }

    try {
        control(*handle, "COMMIT");
    } catch (const std::exception& e) {
        rollback_quietly(*handle, "ROLLBACK");
        reset_quietly(*handle, plan);
        const auto* de = dynamic_cast<const DriverError*>(&e);
        throw TransactionError(std::format("[{}] commit failed: {}", name_, e.what()),
                               de ? de->code() : std::string{}, std::current_exception(), e.what());
    }
    reset_quietly(*handle, plan);
}

void Driver::run_savepoint(TransactionHandle& handle, const TransactionBody& body,
                           const TransactionOptions& options) {
    if (options.isolation_level || options.timeout) {
        warn("transaction options are ignored for a nested transaction; "
             "the enclosing transaction's settings apply");
    }

    const auto savepoint = next_savepoint_name();
    control(handle, "SAVEPOINT " + savepoint);
    ScopeDepth scope(depth_, handle);

    try {
        body(handle);
    } catch (...) {
        // ROLLBACK TO keeps the savepoint on the backend's stack
        rollback_quietly(handle, "ROLLBACK TO SAVEPOINT " + savepoint);
        rollback_quietly(handle, "RELEASE SAVEPOINT " + savepoint);
        throw;
    }
    control(handle, "RELEASE SAVEPOINT " + savepoint);
}

void Driver::control(TransactionHandle& handle, const std::string& sql) {
    (void)run_statement(handle, sql, {}, true);
}

void Driver::rollback_quietly(TransactionHandle& handle, const std::string& sql) {
    try {
        control(handle, sql);
    } catch (const std::exception& e) {
        // Never masks the error that triggered the rollback
        warn(std::format("{} failed: {}", sql, e.what()));
    }
}

void Driver::reset_quietly(TransactionHandle& handle, const TransactionPlan& plan) {
    for (const auto& stmt : plan.reset) {
        try {
            control(handle, stmt);
        } catch (const std::exception& e) {
            warn(std::format("restoring session setting failed ({}): {}", stmt, e.what()));
        }
    }
}

std::string Driver::next_savepoint_name() {
    const auto n = savepoint_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    return std::format("sp_{}_{}", n, utils::epoch_millis());
}

} // namespace unisql
