#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "sql/sql.hpp"
#include <format>

namespace unisql {

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql, const Params& params) {
    if (!conn_) {
        DbResultSet result;
        result.error.message = "Connection is null";
        result.error.code = "2006";
        result.error.native_code = 2006;
        return result;
    }

    const std::string text = params.empty()
        ? sql
        : interpolate_params(sql, params, [this](std::string_view s) { return escape(s); });

    if (mysql_real_query(conn_, text.data(), static_cast<unsigned long>(text.size())) != 0) {
        return process_error();
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        auto result = process_result_set(res);
        mysql_free_result(res);
        return result;
    }

    // No result set: either DML/DDL or an error while storing the result
    if (mysql_field_count(conn_) == 0) {
        return process_affected_rows();
    }
    return process_error();
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::classify(fields[i].type));
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<Value> row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.push_back(MysqlTypeMap::decode(
                    fields[i].type, std::string_view(row[i], lengths[i])));
            } else {
                row_data.emplace_back(std::monostate{});
            }
        }
        result.rows.push_back(std::move(row_data));
    }

    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

DbResultSet MysqlConnection::process_error() {
    DbResultSet result;
    result.success = false;
    result.error.native_code = static_cast<int>(mysql_errno(conn_));
    result.error.code = std::to_string(result.error.native_code);
    result.error.message = mysql_error(conn_);
    result.error.detail = mysql_sqlstate(conn_);
    return result;
}

std::string MysqlConnection::escape(std::string_view text) {
    std::string out(text.size() * 2 + 1, '\0');
    const auto len = mysql_real_escape_string(conn_, out.data(), text.data(),
                                              static_cast<unsigned long>(text.size()));
    out.resize(len);
    return out;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (res) {
            mysql_free_result(res);
        }
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        throw ConnectionError("mysql_init failed");
    }

    // No auto-reconnect: a silent reconnect would drop an open transaction
    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        CLIENT_FOUND_ROWS);

    if (!result) {
        const auto code = mysql_errno(conn);
        std::string reason = mysql_error(conn);
        mysql_close(conn);
        throw ConnectionError(std::format("MySQL connection failed: {}", reason),
                              std::to_string(code));
    }

    return std::make_unique<MysqlConnection>(conn);
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    params.host = "localhost";
    params.port = 3306;

    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // user:password@ (password may itself contain '@')
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    std::string_view host_port = sv;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        std::string_view db = sv.substr(slash_pos + 1);
        if (const auto q = db.find('?'); q != std::string_view::npos) {
            db = db.substr(0, q);
        }
        params.database = std::string(db);
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        params.port = utils::parse_int<unsigned int>(host_port.substr(colon_pos + 1), 3306);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace unisql
