#include "core/column_type.hpp"
#include "core/utils.hpp"

namespace unisql {

Value decode_text_cell(GenericColumnType type, std::string_view text, bool bigint_as_text) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
            if (auto v = utils::try_parse_int<int64_t>(text)) return *v;
            break;

        case GenericColumnType::BIGINT:
            if (bigint_as_text) break;
            if (auto v = utils::try_parse_int<int64_t>(text)) return *v;
            break;

        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
            if (auto v = utils::try_parse_double(text)) return *v;
            break;

        case GenericColumnType::NUMERIC:
            if (bigint_as_text) break;
            if (auto v = utils::try_parse_double(text)) return *v;
            break;

        case GenericColumnType::BOOLEAN:
            if (text == "t" || text == "true" || text == "1") return true;
            if (text == "f" || text == "false" || text == "0") return false;
            break;

        default:
            break;
    }
    return std::string(text);
}

} // namespace unisql
