#pragma once

#include "core/column_type.hpp"

#include <cstdint>
#include <string_view>

namespace unisql {

/**
 * @brief PostgreSQL result column decoding, keyed by type OID
 */
class PgTypeMap {
public:
    /// UNKNOWN for OIDs without special decoding (text, uuid, arrays, ...)
    [[nodiscard]] static GenericColumnType classify(uint32_t oid);

    /**
     * @brief Decode one text-format cell
     *
     * int2/int4 become integers, float4/float8 doubles, bool a bool.
     * int8 and numeric stay text so 64-bit values never lose precision.
     */
    [[nodiscard]] static Value decode(uint32_t oid, std::string_view text) {
        return decode_text_cell(classify(oid), text, /*bigint_as_text=*/true);
    }
};

} // namespace unisql
