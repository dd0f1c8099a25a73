#pragma once

#include "core/types.hpp"

#include <string_view>

namespace unisql {

/**
 * @brief Decode a text-protocol cell into a Value
 *
 * Integers and floats become numbers, BOOLEAN accepts t/f/true/false/1/0,
 * everything else stays text. With bigint_as_text, BIGINT and NUMERIC are
 * kept as strings so 64-bit values never lose precision on the way out.
 * Unparseable numeric text falls back to the original string.
 */
[[nodiscard]] Value decode_text_cell(GenericColumnType type, std::string_view text,
                                     bool bigint_as_text);

} // namespace unisql
