#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace unisql {

/**
 * @brief Loads ClientConfig from TOML (toml++)
 *
 * ${VAR} in any string value is replaced by the environment variable (empty
 * when unset). Validation problems are collected and reported together.
 *
 * Usage:
 *   auto result = ConfigLoader::load_from_file("unisql.toml");
 *   if (!result.success) { utils::log::error(result.error_message); return 1; }
 *   auto registry = DriverRegistry::with_builtin_drivers();
 *   auto driver = registry.create(result.config.drivers[0], ...);
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        ClientConfig config;

        static LoadResult ok(ClientConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found in config; empty when it is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const ClientConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static TracingConfig extract_tracing(const toml::table& root);
    static std::vector<DriverConfig> extract_drivers(const toml::table& root,
                                                     std::vector<std::string>& errors);
    static LoadResult build(const toml::table& root);
};

} // namespace unisql
