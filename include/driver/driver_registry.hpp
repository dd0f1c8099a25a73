#pragma once

#include "config/config_types.hpp"
#include "driver/driver.hpp"

#include <functional>
#include <memory>
#include <unordered_map>

namespace unisql {

/**
 * @brief Maps driver types to factories that build them from configuration
 *
 * Usage:
 *   auto registry = DriverRegistry::with_builtin_drivers();
 *   auto driver = registry.create(*config.find_driver("main"),
 *                                 make_instrumentation(config, tracer));
 */
class DriverRegistry {
public:
    using Factory = std::function<std::unique_ptr<Driver>(const DriverConfig&,
                                                          InstrumentationOptions)>;

    /// Registry with postgresql, mysql, sqlite and d1-http registered
    [[nodiscard]] static DriverRegistry with_builtin_drivers();

    void register_driver(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    /**
     * @brief Build the driver config.type names; nothing connects until first use
     * @throws DriverError when no factory is registered for the type
     */
    [[nodiscard]] std::unique_ptr<Driver> create(const DriverConfig& config,
                                                 InstrumentationOptions instrumentation = {}) const;

    [[nodiscard]] bool has_driver(DatabaseType type) const {
        return factories_.count(type) > 0;
    }

private:
    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Instrumentation for drivers built from config
 *
 * The logger is a StderrQueryLogger at [logging].level (none when "none").
 * tracer is attached only when [tracing].enabled is set.
 */
[[nodiscard]] InstrumentationOptions make_instrumentation(const ClientConfig& config,
                                                          std::shared_ptr<ITracer> tracer = nullptr);

} // namespace unisql
