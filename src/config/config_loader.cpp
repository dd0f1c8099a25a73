#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace unisql {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

template <typename Rep>
Rep non_negative(const toml::table& tbl, std::string_view key, Rep fallback) {
    const auto v = tbl[key].value_or(static_cast<int64_t>(fallback));
    return v < 0 ? fallback : static_cast<Rep>(v);
}

} // namespace

// ============================================================================
// Section extraction
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* l = root["logging"].as_table();
    if (!l) return cfg;

    if (const auto level = (*l)["level"].value<std::string>()) {
        const auto parsed = parse_log_level(*level);
        if (!parsed) {
            throw std::runtime_error(std::format("logging.level: unknown level '{}'", *level));
        }
        cfg.level = *parsed;
    }
    cfg.include_params = (*l)["include_params"].value_or(cfg.include_params);
    return cfg;
}

TracingConfig ConfigLoader::extract_tracing(const toml::table& root) {
    TracingConfig cfg;
    const auto* t = root["tracing"].as_table();
    if (!t) return cfg;

    cfg.enabled = (*t)["enabled"].value_or(cfg.enabled);
    cfg.include_sql = (*t)["include_sql"].value_or(cfg.include_sql);
    return cfg;
}

std::vector<DriverConfig> ConfigLoader::extract_drivers(const toml::table& root,
                                                        std::vector<std::string>& errors) {
    std::vector<DriverConfig> result;
    const auto* arr = root["drivers"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* d = (*arr)[i].as_table();
        if (!d) {
            errors.push_back(std::format("drivers[{}] must be a table", i));
            continue;
        }

        DriverConfig cfg;
        cfg.name = (*d)["name"].value_or(""s);
        cfg.type_str = (*d)["type"].value_or(""s);
        try {
            cfg.type = parse_database_type(cfg.type_str);
        } catch (const std::runtime_error&) {
            errors.push_back(std::format("drivers[{}].type '{}' is not a known driver type",
                                         i, cfg.type_str));
        }

        cfg.connection_string = (*d)["connection_string"].value_or(""s);
        cfg.min_connections = non_negative<size_t>(*d, "min_connections", cfg.min_connections);
        cfg.max_connections = non_negative<size_t>(*d, "max_connections", cfg.max_connections);
        cfg.acquire_timeout = std::chrono::milliseconds(
            non_negative<int64_t>(*d, "acquire_timeout_ms", cfg.acquire_timeout.count()));
        cfg.idle_timeout = std::chrono::seconds(
            non_negative<int64_t>(*d, "idle_timeout_seconds", 300));
        cfg.max_lifetime = std::chrono::seconds(
            non_negative<int64_t>(*d, "max_lifetime_seconds", cfg.max_lifetime.count()));
        cfg.health_check_query = (*d)["health_check_query"].value_or(cfg.health_check_query);
        cfg.pgvector = (*d)["pgvector"].value_or(cfg.pgvector);
        cfg.postgis = (*d)["postgis"].value_or(cfg.postgis);

        cfg.filename = (*d)["filename"].value_or(cfg.filename);
        cfg.busy_timeout = std::chrono::milliseconds(
            non_negative<int64_t>(*d, "busy_timeout_ms", cfg.busy_timeout.count()));
        cfg.foreign_keys = (*d)["foreign_keys"].value_or(cfg.foreign_keys);
        cfg.read_only = (*d)["read_only"].value_or(cfg.read_only);

        cfg.account_id = (*d)["account_id"].value_or(""s);
        cfg.database_id = (*d)["database_id"].value_or(""s);
        cfg.api_token = (*d)["api_token"].value_or(""s);
        cfg.base_url = (*d)["base_url"].value_or(cfg.base_url);
        cfg.request_timeout = std::chrono::milliseconds(
            non_negative<int64_t>(*d, "request_timeout_ms", cfg.request_timeout.count()));

        result.emplace_back(std::move(cfg));
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::build(const toml::table& root) {
    std::vector<std::string> errors;

    ClientConfig config;
    config.logging = extract_logging(root);
    config.tracing = extract_tracing(root);
    config.drivers = extract_drivers(root, errors);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_table(tbl);
        return build(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_table(tbl);
        return build(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ClientConfig& config) {
    std::vector<std::string> errors;
    std::unordered_set<std::string> names;

    for (size_t i = 0; i < config.drivers.size(); ++i) {
        const auto& d = config.drivers[i];
        if (d.name.empty()) {
            errors.push_back(std::format("drivers[{}].name must not be empty", i));
        } else if (!names.insert(d.name).second) {
            errors.push_back(std::format("drivers[{}].name '{}' is already used", i, d.name));
        }

        switch (d.type) {
            case DatabaseType::POSTGRESQL:
            case DatabaseType::MYSQL:
                if (d.connection_string.empty()) {
                    errors.push_back(std::format(
                        "drivers[{}].connection_string must not be empty", i));
                }
                if (d.max_connections == 0) {
                    errors.push_back(std::format("drivers[{}].max_connections must be > 0", i));
                }
                if (d.min_connections > d.max_connections) {
                    errors.push_back(std::format(
                        "drivers[{}].min_connections ({}) > max_connections ({})",
                        i, d.min_connections, d.max_connections));
                }
                break;
            case DatabaseType::SQLITE:
                if (d.filename.empty()) {
                    errors.push_back(std::format("drivers[{}].filename must not be empty", i));
                }
                break;
            case DatabaseType::D1_HTTP:
                if (d.account_id.empty() || d.database_id.empty() || d.api_token.empty()) {
                    errors.push_back(std::format(
                        "drivers[{}] requires account_id, database_id and api_token", i));
                }
                break;
        }
    }

    return errors;
}

} // namespace unisql
