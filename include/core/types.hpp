#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace unisql {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief SQL backend family; decides placeholder syntax and transaction syntax
 */
enum class Dialect {
    POSTGRESQL,
    MYSQL,
    SQLITE
};

[[nodiscard]] inline constexpr std::string_view dialect_to_string(Dialect d) noexcept {
    switch (d) {
        case Dialect::POSTGRESQL: return "postgresql";
        case Dialect::MYSQL:      return "mysql";
        case Dialect::SQLITE:     return "sqlite";
    }
    return "unknown";
}

/**
 * @brief Declared column type, as far as the backend reports one
 *
 * Only the distinctions that change how a cell is decoded or coerced.
 */
enum class GenericColumnType : uint8_t {
    UNKNOWN,
    SMALLINT,
    INTEGER,
    BIGINT,
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,
    TEXT,
    BOOLEAN,
    DATE,
    TIME,
    TIMESTAMP,
    BLOB,
    JSON,
};

enum class IsolationLevel {
    READ_UNCOMMITTED,
    READ_COMMITTED,
    REPEATABLE_READ,
    SERIALIZABLE
};

[[nodiscard]] inline constexpr std::string_view isolation_level_to_sql(IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::READ_UNCOMMITTED: return "READ UNCOMMITTED";
        case IsolationLevel::READ_COMMITTED:   return "READ COMMITTED";
        case IsolationLevel::REPEATABLE_READ:  return "REPEATABLE READ";
        case IsolationLevel::SERIALIZABLE:     return "SERIALIZABLE";
    }
    return "SERIALIZABLE";
}

/**
 * @brief Query-engine operation a statement was issued for.
 * Used for observability and by result-parser middleware.
 */
enum class Operation {
    NONE,
    FIND_MANY,
    FIND_FIRST,
    FIND_UNIQUE,
    CREATE,
    CREATE_MANY,
    UPDATE,
    UPDATE_MANY,
    DELETE,
    DELETE_MANY,
    UPSERT,
    COUNT,
    EXIST,
    AGGREGATE,
    GROUP_BY,
    RAW
};

[[nodiscard]] inline constexpr std::string_view operation_to_string(Operation op) noexcept {
    switch (op) {
        case Operation::NONE:        return "";
        case Operation::FIND_MANY:   return "findMany";
        case Operation::FIND_FIRST:  return "findFirst";
        case Operation::FIND_UNIQUE: return "findUnique";
        case Operation::CREATE:      return "create";
        case Operation::CREATE_MANY: return "createMany";
        case Operation::UPDATE:      return "update";
        case Operation::UPDATE_MANY: return "updateMany";
        case Operation::DELETE:      return "delete";
        case Operation::DELETE_MANY: return "deleteMany";
        case Operation::UPSERT:      return "upsert";
        case Operation::COUNT:       return "count";
        case Operation::EXIST:       return "exist";
        case Operation::AGGREGATE:   return "aggregate";
        case Operation::GROUP_BY:    return "groupBy";
        case Operation::RAW:         return "raw";
    }
    return "";
}

enum class RelationType {
    ONE_TO_ONE,
    ONE_TO_MANY,
    MANY_TO_ONE,
    MANY_TO_MANY
};

/**
 * @brief What a driver does when asked for a transaction it cannot provide
 */
enum class TransactionFallback {
    WARN_AND_RUN,   // run the body directly, no isolation, loud warning
    REJECT          // throw FeatureNotSupportedError
};

// ============================================================================
// Values
// ============================================================================

/**
 * @brief A single SQL parameter or result cell.
 * monostate is SQL NULL.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Params = std::vector<Value>;

[[nodiscard]] inline bool is_null(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Render a value for logs and span attributes (not for SQL).
 */
[[nodiscard]] std::string value_to_display(const Value& v);

[[nodiscard]] std::string params_to_display(const Params& params);

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Canonical execute() result.
 *
 * row_count is rows returned for reads and rows affected for writes.
 * Each row is aligned with columns. column_types is aligned with columns
 * too, or empty when the backend does not report declared types.
 */
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> rows;
    uint64_t row_count = 0;
    std::vector<GenericColumnType> column_types;

    /**
     * @brief Lookup a cell by column name
     * @return nullptr if the row or column does not exist
     */
    [[nodiscard]] const Value* get(size_t row, std::string_view column) const;

    [[nodiscard]] std::optional<size_t> column_index(std::string_view column) const;
};

struct BatchQuery {
    std::string sql;
    Params params;
};

struct TransactionOptions {
    std::optional<IsolationLevel> isolation_level;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Model/operation currently being executed (observability only)
 */
struct QueryContext {
    std::string model;
    Operation operation = Operation::NONE;
};

// ============================================================================
// Capabilities
// ============================================================================

struct DriverCapabilities {
    bool supports_transactions = true;
    bool supports_batch = false;
    bool supports_vector = false;
    bool supports_geospatial = false;
    TransactionFallback transaction_fallback = TransactionFallback::WARN_AND_RUN;
};

} // namespace unisql
