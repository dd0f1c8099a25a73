#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <format>
#include <unordered_map>

namespace unisql {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
    inline constexpr std::string_view D1_HTTP = "d1-http";
    inline constexpr std::string_view D1 = "d1";
}

/**
 * @brief Concrete backend adapter kinds known to the registry
 */
enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
    D1_HTTP,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        case DatabaseType::D1_HTTP: return keys::D1_HTTP;
        default: return "unknown";
    }
}

[[nodiscard]] inline Dialect dialect_of(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return Dialect::POSTGRESQL;
        case DatabaseType::MYSQL: return Dialect::MYSQL;
        case DatabaseType::SQLITE:
        case DatabaseType::D1_HTTP: return Dialect::SQLITE;
    }
    return Dialect::SQLITE;
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE},
        {keys::D1_HTTP,    DatabaseType::D1_HTTP},
        {keys::D1,         DatabaseType::D1_HTTP},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

} // namespace unisql
