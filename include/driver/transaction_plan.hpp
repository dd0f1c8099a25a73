#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace unisql {

/**
 * @brief Statements that open and clean up one top-level transaction
 */
struct TransactionPlan {
    std::vector<std::string> begin;     // run in order before the body
    std::size_t open_index = 0;         // begin[open_index] opens the transaction
    std::vector<std::string> reset;     // session settings undone after COMMIT/ROLLBACK
    std::vector<std::string> warnings;  // options the dialect cannot honor as asked
};

/**
 * @brief Translate portable options into a dialect's transaction syntax
 *
 * postgresql: BEGIN ISOLATION LEVEL x, SET LOCAL statement_timeout
 * mysql:      SET TRANSACTION ISOLATION LEVEL x, START TRANSACTION,
 *             SET SESSION max_execution_time (reset to 0 afterwards)
 * sqlite:     PRAGMA busy_timeout for the transaction, BEGIN. SQLite is
 *             always serializable, so a weaker level is upgraded with a
 *             warning.
 *
 * @param session_timeout Busy timeout restored after a sqlite transaction
 */
[[nodiscard]] TransactionPlan plan_transaction(
    Dialect dialect,
    const TransactionOptions& options,
    std::chrono::milliseconds session_timeout = std::chrono::milliseconds{0});

} // namespace unisql
