#include "db/sqlite/sqlite_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <unordered_map>

namespace unisql {

namespace {

// Binds params[offset..] to stmt; SQLITE_RANGE when too few are supplied
int bind_params(sqlite3_stmt* stmt, const Params& params, size_t offset) {
    const int count = sqlite3_bind_parameter_count(stmt);
    for (int i = 1; i <= count; ++i) {
        const size_t index = offset + static_cast<size_t>(i - 1);
        if (index >= params.size()) {
            return SQLITE_RANGE;
        }
        const auto& v = params[index];
        int rc = SQLITE_OK;
        if (std::holds_alternative<std::monostate>(v)) {
            rc = sqlite3_bind_null(stmt, i);
        } else if (const auto* b = std::get_if<bool>(&v)) {
            rc = sqlite3_bind_int(stmt, i, *b ? 1 : 0);
        } else if (const auto* n = std::get_if<int64_t>(&v)) {
            rc = sqlite3_bind_int64(stmt, i, *n);
        } else if (const auto* d = std::get_if<double>(&v)) {
            rc = sqlite3_bind_double(stmt, i, *d);
        } else if (const auto* s = std::get_if<std::string>(&v)) {
            rc = sqlite3_bind_text(stmt, i, s->data(), static_cast<int>(s->size()),
                                   SQLITE_TRANSIENT);
        }
        if (rc != SQLITE_OK) return rc;
    }
    return SQLITE_OK;
}

Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const auto size = static_cast<size_t>(sqlite3_column_bytes(stmt, col));
            return data ? std::string(data, size) : std::string();
        }
        default:
            return std::monostate{};
    }
}

bool only_whitespace_or_comments(const char* tail) {
    std::string_view rest(tail ? tail : "");
    while (!rest.empty()) {
        const char c = rest.front();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ';') {
            rest.remove_prefix(1);
        } else if (rest.starts_with("--")) {
            const auto nl = rest.find('\n');
            rest = nl == std::string_view::npos ? std::string_view{} : rest.substr(nl + 1);
        } else if (rest.starts_with("/*")) {
            const auto end = rest.find("*/", 2);
            rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql, const Params& params) {
    if (!db_) {
        DbResultSet result;
        result.error.message = "Connection is null";
        result.error.code = "SQLITE_MISUSE";
        result.error.native_code = SQLITE_MISUSE;
        return result;
    }

    DbResultSet result;
    result.success = true;
    const char* cursor = sql.c_str();
    size_t consumed = 0;

    while (cursor && *cursor && !only_whitespace_or_comments(cursor)) {
        sqlite3_stmt* stmt = nullptr;
        const char* tail = nullptr;
        int rc = sqlite3_prepare_v2(db_, cursor, -1, &stmt, &tail);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            return failure(rc);
        }
        if (!stmt) {
            break;  // comment-only remainder
        }

        rc = bind_params(stmt, params, consumed);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            if (rc == SQLITE_RANGE) {
                DbResultSet err;
                err.error.message = std::format("statement expects more than the {} parameters supplied",
                                                params.size());
                err.error.code = "SQLITE_RANGE";
                err.error.native_code = SQLITE_RANGE;
                return err;
            }
            return failure(rc);
        }
        consumed += static_cast<size_t>(sqlite3_bind_parameter_count(stmt));

        // Surplus parameters are rejected before the last statement runs
        const bool last = !tail || !*tail || only_whitespace_or_comments(tail);
        if (last && consumed != params.size()) {
            sqlite3_finalize(stmt);
            break;
        }

        result = step_statement(stmt);
        sqlite3_finalize(stmt);
        if (!result.success) {
            return result;
        }
        cursor = tail;
    }

    if (consumed != params.size()) {
        DbResultSet err;
        err.error.message = std::format("{} parameters supplied but the statement uses {}",
                                        params.size(), consumed);
        err.error.code = "SQLITE_RANGE";
        err.error.native_code = SQLITE_RANGE;
        return err;
    }
    return result;
}

DbResultSet SqliteConnection::step_statement(sqlite3_stmt* stmt) {
    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt);
    result.has_rows = ncols > 0;

    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(sqlite3_column_name(stmt, i));
        result.column_types.push_back(
            sqlite_decltype_to_generic(sqlite3_column_decltype(stmt, i)));
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<Value> row;
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            row.push_back(column_value(stmt, i));
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        return failure(rc);
    }

    result.success = true;
    result.affected_rows = result.has_rows
        ? result.rows.size()
        : static_cast<uint64_t>(sqlite3_changes(db_));
    return result;
}

DbResultSet SqliteConnection::failure(int rc) {
    DbResultSet result;
    result.success = false;
    const int extended = db_ ? sqlite3_extended_errcode(db_) : rc;
    // The handle's code can be stale when the failure came from bind/prepare
    const int code = (extended & 0xff) == (rc & 0xff) ? extended : rc;
    result.error.native_code = code;
    result.error.code = sqlite_code_name(code);
    result.error.message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    return result;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    return execute(health_check_query).success;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    const std::string filename = connection_string.empty() ? options_.filename : connection_string;
    int flags = options_.read_only ? SQLITE_OPEN_READONLY
                                   : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    flags |= SQLITE_OPEN_URI;

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(filename.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close_v2(db);
        throw ConnectionError(std::format("Failed to open SQLite database '{}': {}", filename, reason),
                              sqlite_code_name(rc));
    }
    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, static_cast<int>(options_.busy_timeout.count()));

    auto conn = std::make_unique<SqliteConnection>(db);
    if (options_.foreign_keys) {
        const auto res = conn->execute("PRAGMA foreign_keys = ON");
        if (!res.success) {
            throw ConnectionError(std::format("Failed to enable foreign keys: {}", res.error.message),
                                  res.error.code);
        }
    }

    utils::log::info(std::format("SQLite database opened: {}{}", filename,
                                 options_.read_only ? " (read-only)" : ""));
    return conn;
}

// ============================================================================
// Codes and types
// ============================================================================

std::string sqlite_code_name(int extended_code) {
    static const std::unordered_map<int, const char*> NAMES = {
        {SQLITE_OK, "SQLITE_OK"},
        {SQLITE_ERROR, "SQLITE_ERROR"},
        {SQLITE_INTERNAL, "SQLITE_INTERNAL"},
        {SQLITE_PERM, "SQLITE_PERM"},
        {SQLITE_ABORT, "SQLITE_ABORT"},
        {SQLITE_BUSY, "SQLITE_BUSY"},
        {SQLITE_LOCKED, "SQLITE_LOCKED"},
        {SQLITE_NOMEM, "SQLITE_NOMEM"},
        {SQLITE_READONLY, "SQLITE_READONLY"},
        {SQLITE_INTERRUPT, "SQLITE_INTERRUPT"},
        {SQLITE_IOERR, "SQLITE_IOERR"},
        {SQLITE_CORRUPT, "SQLITE_CORRUPT"},
        {SQLITE_FULL, "SQLITE_FULL"},
        {SQLITE_CANTOPEN, "SQLITE_CANTOPEN"},
        {SQLITE_PROTOCOL, "SQLITE_PROTOCOL"},
        {SQLITE_SCHEMA, "SQLITE_SCHEMA"},
        {SQLITE_TOOBIG, "SQLITE_TOOBIG"},
        {SQLITE_CONSTRAINT, "SQLITE_CONSTRAINT"},
        {SQLITE_MISMATCH, "SQLITE_MISMATCH"},
        {SQLITE_MISUSE, "SQLITE_MISUSE"},
        {SQLITE_AUTH, "SQLITE_AUTH"},
        {SQLITE_RANGE, "SQLITE_RANGE"},
        {SQLITE_NOTADB, "SQLITE_NOTADB"},
        {SQLITE_BUSY_RECOVERY, "SQLITE_BUSY_RECOVERY"},
        {SQLITE_BUSY_SNAPSHOT, "SQLITE_BUSY_SNAPSHOT"},
        {SQLITE_LOCKED_SHAREDCACHE, "SQLITE_LOCKED_SHAREDCACHE"},
        {SQLITE_READONLY_DBMOVED, "SQLITE_READONLY_DBMOVED"},
        {SQLITE_CONSTRAINT_CHECK, "SQLITE_CONSTRAINT_CHECK"},
        {SQLITE_CONSTRAINT_FOREIGNKEY, "SQLITE_CONSTRAINT_FOREIGNKEY"},
        {SQLITE_CONSTRAINT_NOTNULL, "SQLITE_CONSTRAINT_NOTNULL"},
        {SQLITE_CONSTRAINT_PRIMARYKEY, "SQLITE_CONSTRAINT_PRIMARYKEY"},
        {SQLITE_CONSTRAINT_UNIQUE, "SQLITE_CONSTRAINT_UNIQUE"},
        {SQLITE_CONSTRAINT_TRIGGER, "SQLITE_CONSTRAINT_TRIGGER"},
        {SQLITE_CANTOPEN_NOTEMPDIR, "SQLITE_CANTOPEN_NOTEMPDIR"},
        {SQLITE_CANTOPEN_ISDIR, "SQLITE_CANTOPEN_ISDIR"},
        {SQLITE_CANTOPEN_FULLPATH, "SQLITE_CANTOPEN_FULLPATH"},
    };

    if (const auto it = NAMES.find(extended_code); it != NAMES.end()) {
        return it->second;
    }
    if (const auto it = NAMES.find(extended_code & 0xff); it != NAMES.end()) {
        return it->second;
    }
    return std::format("SQLITE_{}", extended_code);
}

GenericColumnType sqlite_decltype_to_generic(const char* decl_type) {
    if (!decl_type || !*decl_type) {
        return GenericColumnType::UNKNOWN;
    }
    const auto upper = utils::to_upper(decl_type);
    if (upper.find("BOOL") != std::string::npos) return GenericColumnType::BOOLEAN;
    if (upper.find("BIGINT") != std::string::npos) return GenericColumnType::BIGINT;
    if (upper.find("INT") != std::string::npos) return GenericColumnType::INTEGER;
    if (upper.find("JSON") != std::string::npos) return GenericColumnType::JSON;
    if (upper.find("CHAR") != std::string::npos || upper.find("CLOB") != std::string::npos ||
        upper.find("TEXT") != std::string::npos) {
        return GenericColumnType::TEXT;
    }
    if (upper.find("BLOB") != std::string::npos) return GenericColumnType::BLOB;
    if (upper.find("REAL") != std::string::npos || upper.find("FLOA") != std::string::npos ||
        upper.find("DOUB") != std::string::npos) {
        return GenericColumnType::DOUBLE_PRECISION;
    }
    if (upper.find("TIMESTAMP") != std::string::npos || upper.find("DATETIME") != std::string::npos) {
        return GenericColumnType::TIMESTAMP;
    }
    if (upper.find("DATE") != std::string::npos) return GenericColumnType::DATE;
    return GenericColumnType::NUMERIC;
}

} // namespace unisql
