#pragma once

#include "core/database_type.hpp"
#include "tracing/query_logger.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace unisql {

// ============================================================================
// Configuration Structs
// ============================================================================

struct LoggingConfig {
    LogLevel level = LogLevel::QUERY;
    bool include_params = false;    // also controls db.query.parameters on spans
};

struct TracingConfig {
    bool enabled = true;
    bool include_sql = true;
};

/**
 * @brief One [[drivers]] entry
 *
 * Fields not used by the driver's type keep their defaults.
 */
struct DriverConfig {
    std::string name;
    std::string type_str;
    DatabaseType type = DatabaseType::SQLITE;

    // Pooled engines (postgresql, mysql)
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::seconds max_lifetime{3600};
    std::string health_check_query = "SELECT 1";
    bool pgvector = false;
    bool postgis = false;

    // sqlite
    std::string filename = ":memory:";
    std::chrono::milliseconds busy_timeout{5000};
    bool foreign_keys = true;
    bool read_only = false;

    // d1-http
    std::string account_id;
    std::string database_id;
    std::string api_token;
    std::string base_url = "https://api.cloudflare.com/client/v4";
    std::chrono::milliseconds request_timeout{30000};
};

struct ClientConfig {
    LoggingConfig logging;
    TracingConfig tracing;
    std::vector<DriverConfig> drivers;

    /// nullptr if no driver has this name
    [[nodiscard]] const DriverConfig* find_driver(std::string_view name) const {
        for (const auto& d : drivers) {
            if (d.name == name) return &d;
        }
        return nullptr;
    }
};

} // namespace unisql
