#pragma once

#include "core/types.hpp"
#include "sql/sql.hpp"

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace unisql {

class ResultParserChain;

/**
 * @brief Uniform operation contract over every SQL backend
 *
 * Implemented by Driver (the root handle of one backend) and by
 * TransactionBoundDriver (the view handed to transaction callbacks).
 * Application code written against IDriver runs unchanged in both places.
 *
 * Every failure surfaces as a DriverError subtype.
 */
class IDriver {
public:
    virtual ~IDriver() = default;

    [[nodiscard]] virtual Dialect dialect() const noexcept = 0;
    [[nodiscard]] virtual const std::string& driver_name() const noexcept = 0;
    [[nodiscard]] virtual const DriverCapabilities& capabilities() const noexcept = 0;
    [[nodiscard]] virtual const ResultParserChain& result_parser() const noexcept = 0;

    /**
     * @brief Render with the dialect's placeholders and execute
     *
     * When a context operation is set, the result passes through the
     * driver's result parser.
     */
    virtual QueryResult execute(const Sql& query) = 0;

    /// Execute SQL text as given (placeholders already in dialect syntax)
    virtual QueryResult execute_raw(const std::string& sql, const Params& params = {}) = 0;

    /**
     * @brief Execute independent statements, one result per query in order
     *
     * Native batch when supported, otherwise one transaction, otherwise
     * sequential with a non-atomicity warning. Empty input returns empty.
     */
    virtual std::vector<QueryResult> execute_batch(const std::vector<BatchQuery>& queries) = 0;

    /**
     * @brief Run fn inside a transaction (a savepoint when already in one)
     *
     * Commits when fn returns, rolls back and rethrows when it throws.
     */
    virtual void with_transaction(const std::function<void(IDriver&)>& fn,
                                  const TransactionOptions& options = {}) = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    virtual void set_context(QueryContext context) = 0;
    virtual void clear_context() = 0;
    [[nodiscard]] virtual QueryContext context() const = 0;

    [[nodiscard]] virtual bool in_transaction() const noexcept = 0;

    /**
     * @brief with_transaction() that hands back the callback's value
     *
     * Usage:
     *   auto id = driver.transaction([](IDriver& tx) {
     *       tx.execute_raw("INSERT INTO t (v) VALUES (?)", {Value{"x"}});
     *       return tx.execute_raw("SELECT last_insert_rowid()").rows[0][0];
     *   });
     */
    template <typename Fn>
    auto transaction(Fn&& fn, const TransactionOptions& options = {})
        -> std::invoke_result_t<Fn&, IDriver&> {
        using R = std::invoke_result_t<Fn&, IDriver&>;
        if constexpr (std::is_void_v<R>) {
            with_transaction([&fn](IDriver& tx) { fn(tx); }, options);
        } else {
            std::optional<R> result;
            with_transaction([&fn, &result](IDriver& tx) { result.emplace(fn(tx)); }, options);
            return std::move(*result);
        }
    }
};

} // namespace unisql
