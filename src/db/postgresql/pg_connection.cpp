#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <optional>
#include <type_traits>
#include <variant>

namespace unisql {

namespace {

std::string field_or_empty(const PGresult* res, int field) {
    const char* value = PQresultErrorField(res, field);
    return value ? value : "";
}

// Text-format parameter; nullopt is SQL NULL
std::optional<std::string> param_text(const Value& v) {
    return std::visit([](const auto& x) -> std::optional<std::string> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(x ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            return std::format("{}", x);
        }
    }, v);
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const Params& params) {
    if (!conn_) {
        DbResultSet result;
        result.error.message = "Connection is null";
        result.error.code = "08003";
        return result;
    }

    std::vector<std::optional<std::string>> texts;
    std::vector<const char*> values;
    texts.reserve(params.size());
    values.reserve(params.size());
    for (const auto& p : params) {
        texts.push_back(param_text(p));
    }
    for (const auto& t : texts) {
        values.push_back(t ? t->c_str() : nullptr);
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,                 // infer types
                                 values.empty() ? nullptr : values.data(),
                                 nullptr, nullptr,        // text format
                                 0);                      // text results

    if (!res) {
        DbResultSet result;
        result.error.message = PQerrorMessage(conn_);
        result.error.code = PQstatus(conn_) == CONNECTION_OK ? "" : "08006";
        return result;
    }

    DbResultSet result;
    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
            result = process_tuples_result(res);
            break;
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
            result = process_command_result(res);
            break;
        default:
            result = process_error(res);
            break;
    }
    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    std::vector<uint32_t> oids;
    oids.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        oids.push_back(static_cast<uint32_t>(PQftype(res, i)));
        result.column_types.push_back(PgTypeMap::classify(oids.back()));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<Value> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::monostate{});
            } else {
                row.push_back(PgTypeMap::decode(oids[j], PQgetvalue(res, i, j)));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

DbResultSet PgConnection::process_error(PGresult* res) {
    DbResultSet result;
    result.success = false;
    result.error.message = utils::trim(PQresultErrorMessage(res));
    result.error.code = field_or_empty(res, PG_DIAG_SQLSTATE);
    result.error.constraint = field_or_empty(res, PG_DIAG_CONSTRAINT_NAME);
    result.error.table = field_or_empty(res, PG_DIAG_TABLE_NAME);
    result.error.column = field_or_empty(res, PG_DIAG_COLUMN_NAME);
    result.error.detail = field_or_empty(res, PG_DIAG_MESSAGE_DETAIL);
    if (result.error.message.empty()) {
        result.error.message = utils::trim(PQerrorMessage(conn_));
    }
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        throw ConnectionError("Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string reason = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        throw ConnectionError(std::format("Failed to connect to PostgreSQL: {}", reason), "08001");
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace unisql
