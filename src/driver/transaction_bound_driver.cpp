#include "driver/transaction_bound_driver.hpp"

namespace unisql {

QueryResult TransactionBoundDriver::execute(const Sql& query) {
    auto stmt = query.to_statement(dialect());
    return ops_.run_statement(handle_, stmt.sql, stmt.params, false);
}

QueryResult TransactionBoundDriver::execute_raw(const std::string& sql, const Params& params) {
    return ops_.run_statement(handle_, sql, params, true);
}

std::vector<QueryResult> TransactionBoundDriver::execute_batch(
    const std::vector<BatchQuery>& queries) {
    if (queries.empty()) return {};
    return ops_.run_batch(handle_, queries, true);
}

void TransactionBoundDriver::with_transaction(const std::function<void(IDriver&)>& fn,
                                              const TransactionOptions& options) {
    ops_.run_transaction(handle_, fn, options);
}

} // namespace unisql
