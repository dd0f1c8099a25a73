#include "core/types.hpp"

#include <format>
#include <type_traits>

namespace unisql {

std::string value_to_display(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::format("'{}'", x);
        } else {
            return std::format("{}", x);
        }
    }, v);
}

std::string params_to_display(const Params& params) {
    std::string out = "[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) out += ", ";
        out += value_to_display(params[i]);
    }
    out += "]";
    return out;
}

std::optional<size_t> QueryResult::column_index(std::string_view column) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == column) return i;
    }
    return std::nullopt;
}

const Value* QueryResult::get(size_t row, std::string_view column) const {
    if (row >= rows.size()) return nullptr;
    const auto idx = column_index(column);
    if (!idx || *idx >= rows[row].size()) return nullptr;
    return &rows[row][*idx];
}

} // namespace unisql
