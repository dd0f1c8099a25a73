#include "sql/sql.hpp"
#include "core/error.hpp"

#include <array>
#include <cctype>
#include <format>
#include <type_traits>

namespace unisql {

PlaceholderStyle placeholder_style_for(Dialect dialect) noexcept {
    switch (dialect) {
        case Dialect::POSTGRESQL: return PlaceholderStyle::DOLLAR_N;
        case Dialect::MYSQL:
        case Dialect::SQLITE:     return PlaceholderStyle::QUESTION;
    }
    return PlaceholderStyle::QUESTION;
}

// ============================================================================
// Sql
// ============================================================================

Sql::Sql()
    : strings_{""}, cache_(std::make_shared<RenderCache>()) {}

Sql::Sql(std::string text)
    : strings_{std::move(text)}, cache_(std::make_shared<RenderCache>()) {}

Sql Sql::join(const std::vector<Sql>& parts, std::string_view separator,
              std::string_view prefix, std::string_view suffix) {
    Sql out;
    if (parts.empty()) return out;

    out.append(prefix);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.append(separator);
        out.append(parts[i]);
    }
    out.append(suffix);
    return out;
}

void Sql::invalidate() {
    // Copies may still share the old cache; give this instance a fresh one
    cache_ = std::make_shared<RenderCache>();
}

Sql& Sql::append(std::string_view text) {
    if (text.empty()) return *this;
    strings_.back().append(text);
    invalidate();
    return *this;
}

Sql& Sql::append(const Sql& other) {
    const auto& other_strings = other.strings_;
    strings_.back().append(other_strings.front());
    for (size_t i = 0; i < other.values_.size(); ++i) {
        values_.push_back(other.values_[i]);
        strings_.push_back(other_strings[i + 1]);
    }
    invalidate();
    return *this;
}

Sql& Sql::bind(Value value) {
    values_.push_back(std::move(value));
    strings_.emplace_back();
    invalidate();
    return *this;
}

bool Sql::is_empty() const {
    return values_.empty() && strings_.size() == 1 && strings_.front().empty();
}

std::string Sql::render(PlaceholderStyle style) const {
    size_t estimate = 0;
    for (const auto& s : strings_) estimate += s.size();
    estimate += values_.size() * 4;

    std::string out;
    out.reserve(estimate);
    out += strings_.front();
    for (size_t i = 0; i < values_.size(); ++i) {
        switch (style) {
            case PlaceholderStyle::DOLLAR_N: out += std::format("${}", i + 1); break;
            case PlaceholderStyle::QUESTION: out += '?'; break;
            case PlaceholderStyle::COLON_N:  out += std::format(":{}", i + 1); break;
        }
        out += strings_[i + 1];
    }
    return out;
}

std::string Sql::text(PlaceholderStyle style) const {
    const auto idx = static_cast<size_t>(style);
    std::lock_guard lock(cache_->mutex);
    auto& slot = cache_->rendered[idx];
    if (!slot) {
        slot = render(style);
    }
    return *slot;
}

Statement Sql::to_statement(PlaceholderStyle style) const {
    return Statement{text(style), values_};
}

Statement Sql::to_statement(Dialect dialect) const {
    return to_statement(placeholder_style_for(dialect));
}

// ============================================================================
// Lexical helpers
// ============================================================================

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

/**
 * @brief If sql[i] opens a comment or quoted section, return the index just
 * past its end; otherwise return i.
 */
size_t skip_non_code(std::string_view sql, size_t i) {
    const char c = sql[i];
    const char next = i + 1 < sql.size() ? sql[i + 1] : '\0';

    if (c == '-' && next == '-') {
        const auto eol = sql.find('\n', i + 2);
        return eol == std::string_view::npos ? sql.size() : eol + 1;
    }
    if (c == '/' && next == '*') {
        const auto end = sql.find("*/", i + 2);
        return end == std::string_view::npos ? sql.size() : end + 2;
    }
    if (c == '\'' || c == '"' || c == '`') {
        size_t j = i + 1;
        while (j < sql.size()) {
            if (sql[j] == '\\' && c == '\'' && j + 1 < sql.size()) {
                j += 2;
                continue;
            }
            if (sql[j] == c) {
                // Doubled quote is an escaped quote
                if (j + 1 < sql.size() && sql[j + 1] == c) {
                    j += 2;
                    continue;
                }
                return j + 1;
            }
            ++j;
        }
        return sql.size();
    }
    return i;
}

std::string_view leading_keyword(std::string_view sql) {
    size_t i = 0;
    while (i < sql.size()) {
        if (std::isspace(static_cast<unsigned char>(sql[i])) || sql[i] == '(') {
            ++i;
            continue;
        }
        const char next = i + 1 < sql.size() ? sql[i + 1] : '\0';
        if ((sql[i] == '-' && next == '-') || (sql[i] == '/' && next == '*')) {
            i = skip_non_code(sql, i);
            continue;
        }
        break;
    }
    size_t end = i;
    while (end < sql.size() && is_ident_char(sql[end])) ++end;
    return sql.substr(i, end - i);
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool contains_keyword(std::string_view sql, std::string_view keyword) {
    size_t i = 0;
    while (i < sql.size()) {
        const size_t skipped = skip_non_code(sql, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        if (is_ident_char(sql[i])) {
            size_t end = i;
            while (end < sql.size() && is_ident_char(sql[end])) ++end;
            if (iequals(sql.substr(i, end - i), keyword)) return true;
            i = end;
            continue;
        }
        ++i;
    }
    return false;
}

} // anonymous namespace

StatementShape classify_statement(std::string_view sql) {
    static constexpr std::array<std::string_view, 7> kRowKeywords = {
        "SELECT", "WITH", "VALUES", "PRAGMA", "SHOW", "EXPLAIN", "DESCRIBE"
    };

    const auto first = leading_keyword(sql);
    for (const auto kw : kRowKeywords) {
        if (iequals(first, kw)) return StatementShape::ROWS;
    }
    if (contains_keyword(sql, "RETURNING")) return StatementShape::ROWS;
    return StatementShape::AFFECTED_ROWS;
}

// ============================================================================
// Interpolation
// ============================================================================

std::string escape_sql_literal(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (const char c : text) {
        if (c == '\'') out += "''";
        else if (c == '\\') out += "\\\\";
        else out += c;
    }
    return out;
}

std::string interpolate_params(std::string_view sql, const Params& params,
                               const LiteralEscaper& escape) {
    std::string out;
    out.reserve(sql.size() + params.size() * 8);

    size_t param_idx = 0;
    size_t i = 0;
    while (i < sql.size()) {
        const size_t skipped = skip_non_code(sql, i);
        if (skipped != i) {
            out.append(sql.substr(i, skipped - i));
            i = skipped;
            continue;
        }
        if (sql[i] != '?') {
            out += sql[i++];
            continue;
        }

        if (param_idx >= params.size()) {
            throw QueryError(
                std::format("Statement has more placeholders than the {} parameters supplied",
                            params.size()),
                std::string(sql), params);
        }

        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out += "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += v ? "1" : "0";
            } else if constexpr (std::is_same_v<T, std::string>) {
                out += '\'';
                out += escape(v);
                out += '\'';
            } else {
                out += std::format("{}", v);
            }
        }, params[param_idx]);

        ++param_idx;
        ++i;
    }

    if (param_idx != params.size()) {
        throw QueryError(
            std::format("Statement has {} placeholders but {} parameters were supplied",
                        param_idx, params.size()),
            std::string(sql), params);
    }
    return out;
}

} // namespace unisql
