#pragma once

#include "core/column_type.hpp"

#include <mysql/mysql.h>
#include <string>
#include <string_view>

namespace unisql {

/**
 * @brief MySQL result column decoding, keyed by field type
 */
class MysqlTypeMap {
public:
    [[nodiscard]] static GenericColumnType classify(enum_field_types field_type);

    /**
     * @brief Decode one text-protocol cell
     *
     * Integer types (BIGINT included) become integers, FLOAT/DOUBLE doubles,
     * DECIMAL and everything else text. Unsigned BIGINT values beyond the
     * signed range stay text.
     */
    [[nodiscard]] static Value decode(enum_field_types field_type, std::string_view text) {
        const auto type = classify(field_type);
        if (type == GenericColumnType::NUMERIC) {
            return std::string(text);
        }
        return decode_text_cell(type, text, /*bigint_as_text=*/false);
    }
};

} // namespace unisql
