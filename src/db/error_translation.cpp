#include "db/error_translation.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace unisql {

namespace {

std::vector<std::string> split_columns(std::string_view list) {
    std::vector<std::string> columns;
    size_t start = 0;
    while (start <= list.size()) {
        auto end = list.find(',', start);
        if (end == std::string_view::npos) end = list.size();
        auto column = utils::trim(list.substr(start, end - start));
        if (!column.empty()) columns.push_back(std::move(column));
        start = end + 1;
    }
    return columns;
}

// "Key (email, tenant_id)=(a@b, 1) already exists." -> [email, tenant_id]
std::vector<std::string> pg_key_columns(std::string_view detail) {
    const auto open = detail.find("Key (");
    if (open == std::string_view::npos) return {};
    const auto begin = open + 5;
    const auto close = detail.find(")=", begin);
    if (close == std::string_view::npos) return {};
    return split_columns(detail.substr(begin, close - begin));
}

// Text between the first occurrence of open and the next close
std::string between(std::string_view text, std::string_view open, std::string_view close) {
    const auto start = text.find(open);
    if (start == std::string_view::npos) return {};
    const auto begin = start + open.size();
    const auto end = text.find(close, begin);
    if (end == std::string_view::npos) return {};
    return std::string(text.substr(begin, end - begin));
}

bool is_pg_connection_code(std::string_view code) {
    return code.starts_with("08") || code == "28000" || code == "28P01" ||
           code == "57P01" || code == "57P02" || code == "57P03" || code == "53300";
}

bool is_mysql_connection_code(int code) {
    switch (code) {
        case 1040:  // too many connections
        case 1045:  // access denied
        case 2002:  // can't connect (socket)
        case 2003:  // can't connect (tcp)
        case 2006:  // server has gone away
        case 2013:  // lost connection during query
            return true;
        default:
            return false;
    }
}

} // namespace

void translate_pg_error(const BackendError& error, const std::string& sql, const Params& params) {
    const auto& code = error.code;

    if (code == "23505") {
        ConstraintInfo info{error.constraint, error.table, pg_key_columns(error.detail)};
        if (info.columns.empty() && !error.column.empty()) {
            info.columns.push_back(error.column);
        }
        throw UniqueConstraintError(error.message, sql, params, code, std::move(info));
    }
    if (code == "23503") {
        ConstraintInfo info{error.constraint, error.table, pg_key_columns(error.detail)};
        throw ForeignKeyError(error.message, sql, params, code, std::move(info));
    }
    if (is_pg_connection_code(code)) {
        throw ConnectionError(error.message, code);
    }
    throw QueryError(error.message, sql, params, code);
}

void translate_mysql_error(const BackendError& error, const std::string& sql, const Params& params) {
    const int errnum = error.native_code != 0 ? error.native_code
                                              : utils::parse_int<int>(error.code, 0);
    const auto code = std::to_string(errnum);

    if (errnum == 1062) {
        // Duplicate entry 'x' for key 'users.users_email_key'
        ConstraintInfo info;
        const auto key = between(error.message, "for key '", "'");
        if (const auto dot = key.find('.'); dot != std::string::npos) {
            info.table = key.substr(0, dot);
            info.constraint = key.substr(dot + 1);
        } else {
            info.constraint = key;
        }
        throw UniqueConstraintError(error.message, sql, params, code, std::move(info));
    }
    if (errnum == 1451 || errnum == 1452) {
        // ... fails (`db`.`child`, CONSTRAINT `fk` FOREIGN KEY (`col`) REFERENCES ...)
        ConstraintInfo info;
        info.constraint = between(error.message, "CONSTRAINT `", "`");
        const auto qualified = between(error.message, "(`", ", CONSTRAINT");
        if (const auto dot = qualified.find("`.`"); dot != std::string::npos) {
            info.table = qualified.substr(dot + 3, qualified.size() - dot - 4);
        }
        const auto column = between(error.message, "FOREIGN KEY (`", "`)");
        if (!column.empty()) info.columns.push_back(column);
        throw ForeignKeyError(error.message, sql, params, code, std::move(info));
    }
    if (is_mysql_connection_code(errnum)) {
        throw ConnectionError(error.message, code);
    }
    throw QueryError(error.message, sql, params, code);
}

void translate_sqlite_error(const BackendError& error, const std::string& sql, const Params& params) {
    const auto& code = error.code;
    const auto& message = error.message;

    if (code == "SQLITE_CONSTRAINT_UNIQUE" || code == "SQLITE_CONSTRAINT_PRIMARYKEY" ||
        message.find("UNIQUE constraint failed") != std::string::npos) {
        // UNIQUE constraint failed: users.email, users.tenant_id
        ConstraintInfo info;
        const auto pos = message.find("constraint failed:");
        if (pos != std::string::npos) {
            auto list = std::string_view(message).substr(pos + 18);
            // Services append ": SQLITE_CONSTRAINT" to the message
            if (const auto suffix = list.find(": SQLITE_"); suffix != std::string_view::npos) {
                list = list.substr(0, suffix);
            }
            for (auto& qualified : split_columns(list)) {
                if (const auto dot = qualified.find('.'); dot != std::string::npos) {
                    if (info.table.empty()) info.table = qualified.substr(0, dot);
                    info.columns.push_back(qualified.substr(dot + 1));
                } else {
                    info.columns.push_back(std::move(qualified));
                }
            }
        }
        // SQLite does not report the index name: constraint stays empty
        throw UniqueConstraintError(message, sql, params,
                                    code.empty() ? "SQLITE_CONSTRAINT_UNIQUE" : code,
                                    std::move(info));
    }
    if (code == "SQLITE_CONSTRAINT_FOREIGNKEY" ||
        message.find("FOREIGN KEY constraint failed") != std::string::npos) {
        throw ForeignKeyError(message, sql, params,
                              code.empty() ? "SQLITE_CONSTRAINT_FOREIGNKEY" : code,
                              ConstraintInfo{});
    }
    if (code.starts_with("SQLITE_CANTOPEN") || code == "SQLITE_NOTADB") {
        throw ConnectionError(message, code);
    }
    throw QueryError(message, sql, params, code);
}

void translate_sqlite_message(const std::string& message, const std::string& sql,
                              const Params& params) {
    BackendError error;
    error.message = message;

    if (message.find("UNIQUE constraint failed") != std::string::npos) {
        error.code = "SQLITE_CONSTRAINT_UNIQUE";
    } else if (message.find("FOREIGN KEY constraint failed") != std::string::npos) {
        error.code = "SQLITE_CONSTRAINT_FOREIGNKEY";
    } else if (message.find("database is locked") != std::string::npos) {
        error.code = "SQLITE_BUSY";
    } else if (const auto pos = message.find("SQLITE_"); pos != std::string::npos) {
        auto end = pos;
        while (end < message.size() &&
               (std::isupper(static_cast<unsigned char>(message[end])) || message[end] == '_')) {
            ++end;
        }
        error.code = message.substr(pos, end - pos);
    }
    translate_sqlite_error(error, sql, params);
}

} // namespace unisql
