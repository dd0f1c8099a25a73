#include "db/postgresql/pg_type_map.hpp"

namespace unisql {

namespace {

// From pg_type.dat; stable across server versions
namespace oid {
    constexpr uint32_t BOOL = 16;
    constexpr uint32_t BYTEA = 17;
    constexpr uint32_t INT8 = 20;
    constexpr uint32_t INT2 = 21;
    constexpr uint32_t INT4 = 23;
    constexpr uint32_t TEXT = 25;
    constexpr uint32_t OID = 26;
    constexpr uint32_t JSON = 114;
    constexpr uint32_t FLOAT4 = 700;
    constexpr uint32_t FLOAT8 = 701;
    constexpr uint32_t BPCHAR = 1042;
    constexpr uint32_t VARCHAR = 1043;
    constexpr uint32_t DATE = 1082;
    constexpr uint32_t TIME = 1083;
    constexpr uint32_t TIMESTAMP = 1114;
    constexpr uint32_t TIMESTAMPTZ = 1184;
    constexpr uint32_t TIMETZ = 1266;
    constexpr uint32_t NUMERIC = 1700;
    constexpr uint32_t JSONB = 3802;
} // namespace oid

} // namespace

GenericColumnType PgTypeMap::classify(uint32_t type_oid) {
    switch (type_oid) {
        case oid::BOOL:        return GenericColumnType::BOOLEAN;
        case oid::INT2:        return GenericColumnType::SMALLINT;
        case oid::INT4:
        case oid::OID:         return GenericColumnType::INTEGER;
        case oid::INT8:        return GenericColumnType::BIGINT;
        case oid::FLOAT4:      return GenericColumnType::REAL;
        case oid::FLOAT8:      return GenericColumnType::DOUBLE_PRECISION;
        case oid::NUMERIC:     return GenericColumnType::NUMERIC;
        case oid::TEXT:
        case oid::BPCHAR:
        case oid::VARCHAR:     return GenericColumnType::TEXT;
        case oid::BYTEA:       return GenericColumnType::BLOB;
        case oid::JSON:
        case oid::JSONB:       return GenericColumnType::JSON;
        case oid::DATE:        return GenericColumnType::DATE;
        case oid::TIME:
        case oid::TIMETZ:      return GenericColumnType::TIME;
        case oid::TIMESTAMP:
        case oid::TIMESTAMPTZ: return GenericColumnType::TIMESTAMP;
        default:               return GenericColumnType::UNKNOWN;
    }
}

} // namespace unisql
