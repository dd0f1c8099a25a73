#pragma once

#include "core/types.hpp"

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unisql {

/**
 * @brief Placeholder syntax a backend expects for bound parameters
 */
enum class PlaceholderStyle : uint8_t {
    DOLLAR_N = 0,   // $1, $2, ...   (postgres family)
    QUESTION = 1,   // ?, ?, ...     (mysql, sqlite)
    COLON_N  = 2,   // :1, :2, ...
};

[[nodiscard]] PlaceholderStyle placeholder_style_for(Dialect dialect) noexcept;

/**
 * @brief Rendered statement: SQL text plus parameters in placeholder order
 */
struct Statement {
    std::string sql;
    Params params;
};

/**
 * @brief Composable parameterized SQL fragment
 *
 * Holds literal text pieces interleaved with values. Nested fragments are
 * spliced in place, keeping their values in order. This is a placeholder
 * adapter only: the text is never parsed.
 *
 * Usage:
 *   Sql q = Sql("SELECT * FROM users WHERE id = ").bind(int64_t{42})
 *               .append(" AND ").append(Sql("name = ").bind("ann"));
 *   auto stmt = q.to_statement(PlaceholderStyle::DOLLAR_N);
 *   // stmt.sql == "SELECT * FROM users WHERE id = $1 AND name = $2"
 *
 * Rendering is memoized per style; a copy shares the cache until either
 * side is modified. Rendering the same fragment from several threads is safe.
 */
class Sql {
public:
    Sql();
    explicit Sql(std::string text);

    [[nodiscard]] static Sql raw(std::string text) { return Sql(std::move(text)); }
    [[nodiscard]] static Sql empty() { return Sql(); }

    /**
     * @brief Join fragments with a separator, wrapped in prefix/suffix.
     * An empty list renders as an empty fragment (no prefix/suffix).
     */
    [[nodiscard]] static Sql join(const std::vector<Sql>& parts,
                                  std::string_view separator = ", ",
                                  std::string_view prefix = {},
                                  std::string_view suffix = {});

    Sql& append(std::string_view text);
    Sql& append(const Sql& other);
    Sql& bind(Value value);

    // Exact-type overloads so integral and floating arguments never narrow
    Sql& bind(std::nullptr_t) { return bind(Value(std::monostate{})); }
    Sql& bind(bool value) { return bind(Value(value)); }
    Sql& bind(int value) { return bind(Value(static_cast<int64_t>(value))); }
    Sql& bind(long value) { return bind(Value(static_cast<int64_t>(value))); }
    Sql& bind(long long value) { return bind(Value(static_cast<int64_t>(value))); }
    Sql& bind(double value) { return bind(Value(value)); }
    Sql& bind(const char* value) { return bind(Value(std::string(value))); }
    Sql& bind(std::string value) { return bind(Value(std::move(value))); }

    [[nodiscard]] bool is_empty() const;

    [[nodiscard]] const Params& values() const noexcept { return values_; }
    [[nodiscard]] const std::vector<std::string>& strings() const noexcept { return strings_; }

    /// Rendered text for a placeholder style (memoized)
    [[nodiscard]] std::string text(PlaceholderStyle style) const;

    [[nodiscard]] Statement to_statement(PlaceholderStyle style) const;
    [[nodiscard]] Statement to_statement(Dialect dialect) const;

    friend Sql operator+(Sql lhs, const Sql& rhs) {
        lhs.append(rhs);
        return lhs;
    }

private:
    struct RenderCache {
        std::mutex mutex;
        std::array<std::optional<std::string>, 3> rendered;
    };

    [[nodiscard]] std::string render(PlaceholderStyle style) const;
    void invalidate();

    // strings_.size() == values_.size() + 1
    std::vector<std::string> strings_;
    Params values_;
    std::shared_ptr<RenderCache> cache_;
};

// ============================================================================
// Statement shape
// ============================================================================

enum class StatementShape {
    ROWS,           // returns a row set: row_count = rows returned
    AFFECTED_ROWS   // write/DDL: row_count = rows affected
};

/**
 * @brief Classify a statement by shape
 *
 * ROWS for a leading SELECT/WITH (after whitespace and comments, any case),
 * and for a RETURNING keyword anywhere outside quotes and comments.
 * Leading VALUES, PRAGMA, SHOW, EXPLAIN and DESCRIBE also return rows.
 *
 * Native adapters take the shape from the backend's result metadata. The D1
 * driver uses this to pick row_count, since its wire format cannot tell a
 * read from a write. Query compilers can use it to route a statement before
 * running it.
 */
[[nodiscard]] StatementShape classify_statement(std::string_view sql);

// ============================================================================
// Client-side interpolation
// ============================================================================

using LiteralEscaper = std::function<std::string(std::string_view)>;

/**
 * @brief Replace each '?' outside quoted text/comments with a literal
 *
 * For backends whose protocol has no server-side binding. Strings are
 * passed through escape and wrapped in single quotes; booleans become 1/0,
 * NULL becomes NULL.
 * @throws QueryError when placeholder and parameter counts differ
 */
[[nodiscard]] std::string interpolate_params(std::string_view sql, const Params& params,
                                             const LiteralEscaper& escape);

/**
 * @brief Default escaper doubling single quotes and backslashes
 */
[[nodiscard]] std::string escape_sql_literal(std::string_view text);

} // namespace unisql
