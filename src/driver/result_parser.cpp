#include "driver/result_parser.hpp"
#include "core/utils.hpp"

namespace unisql {

// ============================================================================
// ResultParserChain
// ============================================================================

ResultParserChain& ResultParserChain::add(ResultParserMiddleware middleware) {
    middleware_.push_back(std::move(middleware));
    return *this;
}

QueryResult ResultParserChain::parse_result(QueryResult result, Operation operation) const {
    return result_at(0, std::move(result), operation);
}

JsonValue ResultParserChain::parse_relation(const Value& value, RelationType type) const {
    return relation_at(0, value, type);
}

Value ResultParserChain::parse_field(const Value& value, GenericColumnType field_type) const {
    return field_at(0, value, field_type);
}

QueryResult ResultParserChain::result_at(size_t index, QueryResult result,
                                         Operation operation) const {
    // Skip middleware without this hook
    while (index < middleware_.size() && !middleware_[index].parse_result) ++index;
    if (index == middleware_.size()) return result;

    const ResultNext next = [this, index, operation](QueryResult r) {
        return result_at(index + 1, std::move(r), operation);
    };
    return middleware_[index].parse_result(std::move(result), operation, next);
}

JsonValue ResultParserChain::relation_at(size_t index, const Value& value,
                                         RelationType type) const {
    while (index < middleware_.size() && !middleware_[index].parse_relation) ++index;
    if (index == middleware_.size()) return JsonValue::from_value(value);

    const RelationNext next = [this, index, type](const Value& v) {
        return relation_at(index + 1, v, type);
    };
    return middleware_[index].parse_relation(value, type, next);
}

Value ResultParserChain::field_at(size_t index, const Value& value,
                                  GenericColumnType field_type) const {
    while (index < middleware_.size() && !middleware_[index].parse_field) ++index;
    if (index == middleware_.size()) return value;

    const FieldNext next = [this, index, field_type](const Value& v) {
        return field_at(index + 1, v, field_type);
    };
    return middleware_[index].parse_field(value, field_type, next);
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

bool is_count_column(std::string_view name) {
    const auto lower = utils::to_lower(utils::trim(name));
    return lower == "count" || lower == "_count" || lower.starts_with("count(");
}

std::optional<int64_t> to_integer(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) {
        if (!in_integer_range<int64_t>(*d)) return std::nullopt;
        return static_cast<int64_t>(*d);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return utils::try_parse_int<int64_t>(utils::trim(*s));
    }
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1 : 0;
    return std::nullopt;
}

bool is_count_operation(Operation operation) {
    return operation == Operation::COUNT || operation == Operation::EXIST;
}

} // namespace

QueryResult normalize_count_result(QueryResult result) {
    if (result.columns.size() != 1 || !is_count_column(result.columns[0])) {
        return result;
    }
    for (auto& row : result.rows) {
        if (row.empty()) continue;
        if (auto n = to_integer(row[0])) row[0] = *n;
    }
    result.columns[0] = "_result";
    return result;
}

std::optional<JsonValue> try_parse_json_string(const Value& value) {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) return std::nullopt;

    const auto text = utils::trim(*s);
    if (text.empty() || (text.front() != '{' && text.front() != '[')) {
        return std::nullopt;
    }
    try {
        return JsonValue::parse(std::string(text));
    } catch (const JsonValue::parse_error&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_integer_boolean(const Value& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* i = std::get_if<int64_t>(&value)) {
        if (*i == 0) return false;
        if (*i == 1) return true;
    }
    return std::nullopt;
}

Value collapse_bigint(const Value& value) {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) return value;
    if (auto n = utils::try_parse_int<int64_t>(*s)) return *n;
    return value;
}

// ============================================================================
// Presets
// ============================================================================

namespace {

ResultParserMiddleware count_normalizer() {
    ResultParserMiddleware m;
    m.name = "count";
    m.parse_result = [](QueryResult result, Operation operation, const ResultNext& next) {
        if (is_count_operation(operation)) {
            result = normalize_count_result(std::move(result));
        }
        return next(std::move(result));
    };
    return m;
}

ResultParserMiddleware json_text_relations() {
    ResultParserMiddleware m;
    m.name = "json-relations";
    m.parse_relation = [](const Value& value, RelationType, const RelationNext& next) {
        if (auto parsed = try_parse_json_string(value)) return std::move(*parsed);
        return next(value);
    };
    return m;
}

ResultParserMiddleware integer_booleans() {
    ResultParserMiddleware m;
    m.name = "integer-booleans";
    m.parse_field = [](const Value& value, GenericColumnType type, const FieldNext& next) -> Value {
        if (type == GenericColumnType::BOOLEAN) {
            if (auto b = parse_integer_boolean(value)) return *b;
        }
        return next(value);
    };
    return m;
}

ResultParserMiddleware bigint_collapse() {
    ResultParserMiddleware m;
    m.name = "bigint";
    m.parse_result = [](QueryResult result, Operation operation, const ResultNext& next) {
        if (is_count_operation(operation)) {
            for (auto& row : result.rows) {
                for (auto& cell : row) cell = collapse_bigint(cell);
            }
        }
        return next(std::move(result));
    };
    return m;
}

} // namespace

ResultParserChain sqlite_result_parser() {
    ResultParserChain chain;
    chain.add(count_normalizer()).add(json_text_relations()).add(integer_booleans());
    return chain;
}

ResultParserChain mysql_result_parser() {
    return sqlite_result_parser();
}

ResultParserChain postgres_result_parser() {
    ResultParserChain chain;
    chain.add(count_normalizer()).add(bigint_collapse()).add(json_text_relations());
    return chain;
}

} // namespace unisql
