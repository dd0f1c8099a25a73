#pragma once

#include "core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace unisql {

class DriverClient;
class IDriver;

/**
 * @brief Internal operations of a Driver, addressed to an explicit target
 *
 * The target is either the driver's root client or an open transaction
 * handle. TransactionBoundDriver receives this interface at construction
 * and routes every call through it with its own handle as the target.
 */
class DriverOps {
public:
    virtual ~DriverOps() = default;

    /// Instrumented statement; raw skips the result parser
    virtual QueryResult run_statement(DriverClient& target, const std::string& sql,
                                      const Params& params, bool raw) = 0;

    /// Batch with the capability policy; bound means target is an open transaction
    virtual std::vector<QueryResult> run_batch(DriverClient& target,
                                               const std::vector<BatchQuery>& queries,
                                               bool bound) = 0;

    /// Transaction on target; a TransactionHandle target nests as a savepoint
    virtual void run_transaction(DriverClient& target,
                                 const std::function<void(IDriver&)>& fn,
                                 const TransactionOptions& options) = 0;
};

} // namespace unisql
