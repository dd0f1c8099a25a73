#include "driver/transaction_plan.hpp"

#include <format>

namespace unisql {

namespace {

TransactionPlan plan_postgres(const TransactionOptions& options) {
    TransactionPlan plan;
    if (options.isolation_level) {
        plan.begin.push_back(std::format("BEGIN ISOLATION LEVEL {}",
                                         isolation_level_to_sql(*options.isolation_level)));
    } else {
        plan.begin.emplace_back("BEGIN");
    }
    // SET LOCAL ends with the transaction, nothing to reset
    if (options.timeout) {
        plan.begin.push_back(std::format("SET LOCAL statement_timeout = {}",
                                         options.timeout->count()));
    }
    return plan;
}

TransactionPlan plan_mysql(const TransactionOptions& options) {
    TransactionPlan plan;
    if (options.isolation_level) {
        // Applies to the next transaction only
        plan.begin.push_back(std::format("SET TRANSACTION ISOLATION LEVEL {}",
                                         isolation_level_to_sql(*options.isolation_level)));
    }
    if (options.timeout) {
        plan.begin.push_back(std::format("SET SESSION max_execution_time = {}",
                                         options.timeout->count()));
        plan.reset.emplace_back("SET SESSION max_execution_time = 0");
    }
    plan.open_index = plan.begin.size();
    plan.begin.emplace_back("START TRANSACTION");
    return plan;
}

TransactionPlan plan_sqlite(const TransactionOptions& options,
                            std::chrono::milliseconds session_timeout) {
    TransactionPlan plan;
    if (options.isolation_level && *options.isolation_level != IsolationLevel::SERIALIZABLE) {
        plan.warnings.push_back(std::format(
            "sqlite transactions are always SERIALIZABLE; requested isolation level {} was upgraded",
            isolation_level_to_sql(*options.isolation_level)));
    }
    if (options.timeout) {
        plan.begin.push_back(std::format("PRAGMA busy_timeout = {}", options.timeout->count()));
        plan.reset.push_back(std::format("PRAGMA busy_timeout = {}", session_timeout.count()));
    }
    plan.open_index = plan.begin.size();
    plan.begin.emplace_back("BEGIN");
    return plan;
}

} // namespace

TransactionPlan plan_transaction(Dialect dialect,
                                 const TransactionOptions& options,
                                 std::chrono::milliseconds session_timeout) {
    switch (dialect) {
        case Dialect::POSTGRESQL: return plan_postgres(options);
        case Dialect::MYSQL:      return plan_mysql(options);
        case Dialect::SQLITE:     return plan_sqlite(options, session_timeout);
    }
    return plan_postgres(options);
}

} // namespace unisql
