#include "db/idb_connection.hpp"

namespace unisql {

QueryResult DbResultSet::to_query_result() && {
    QueryResult result;
    result.columns = std::move(column_names);
    result.rows = std::move(rows);
    result.column_types = std::move(column_types);
    result.row_count = has_rows ? result.rows.size() : affected_rows;
    return result;
}

} // namespace unisql
