#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace unisql {

// ============================================================================
// Middleware
// ============================================================================

using ResultNext = std::function<QueryResult(QueryResult)>;
using RelationNext = std::function<JsonValue(const Value&)>;
using FieldNext = std::function<Value(const Value&)>;

/**
 * @brief One normalization step; every hook is optional
 *
 * A hook that does not apply must hand its input to next unchanged and
 * must not throw on shapes it does not recognize.
 */
struct ResultParserMiddleware {
    std::string name;
    std::function<QueryResult(QueryResult, Operation, const ResultNext&)> parse_result;
    std::function<JsonValue(const Value&, RelationType, const RelationNext&)> parse_relation;
    std::function<Value(const Value&, GenericColumnType, const FieldNext&)> parse_field;
};

/**
 * @brief Ordered middleware list with a terminal pass-through
 *
 * The first middleware added runs first. The terminal step returns results
 * and fields unchanged and converts relations with JsonValue::from_value.
 */
class ResultParserChain {
public:
    ResultParserChain() = default;

    ResultParserChain& add(ResultParserMiddleware middleware);

    [[nodiscard]] bool empty() const noexcept { return middleware_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

    [[nodiscard]] QueryResult parse_result(QueryResult result, Operation operation) const;
    [[nodiscard]] JsonValue parse_relation(const Value& value, RelationType type) const;
    [[nodiscard]] Value parse_field(const Value& value, GenericColumnType field_type) const;

private:
    QueryResult result_at(size_t index, QueryResult result, Operation operation) const;
    JsonValue relation_at(size_t index, const Value& value, RelationType type) const;
    Value field_at(size_t index, const Value& value, GenericColumnType field_type) const;

    std::vector<ResultParserMiddleware> middleware_;
};

// ============================================================================
// Shared helpers
// ============================================================================

/**
 * @brief Collapse a single count column to an integer "_result" column
 *
 * Recognizes count, COUNT(*), count(distinct x) and similar names. Results
 * of any other shape are returned unchanged.
 */
[[nodiscard]] QueryResult normalize_count_result(QueryResult result);

/// Parse a string cell holding a JSON object or array; nullopt otherwise
[[nodiscard]] std::optional<JsonValue> try_parse_json_string(const Value& value);

/// 0/1 integers (and real booleans) as bool; nullopt for anything else
[[nodiscard]] std::optional<bool> parse_integer_boolean(const Value& value);

/// Integer text that fits in 64 bits becomes an integer; others unchanged
[[nodiscard]] Value collapse_bigint(const Value& value);

// ============================================================================
// Presets
// ============================================================================

/// Count normalization, JSON-text relations and 0/1 booleans
[[nodiscard]] ResultParserChain sqlite_result_parser();

/// Same normalizations as sqlite; MySQL has no native boolean either
[[nodiscard]] ResultParserChain mysql_result_parser();

/// Count normalization plus 64-bit text collapse for count/exist
[[nodiscard]] ResultParserChain postgres_result_parser();

} // namespace unisql
