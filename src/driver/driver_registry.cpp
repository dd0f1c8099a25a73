#include "driver/driver_registry.hpp"
#include "d1/d1_http_driver.hpp"
#include "mysql/mysql_driver.hpp"
#include "postgresql/pg_driver.hpp"
#include "sqlite/sqlite_driver.hpp"

#include <format>

namespace unisql {

namespace {

PoolConfig pool_config(const DriverConfig& cfg) {
    PoolConfig pool;
    pool.connection_string = cfg.connection_string;
    pool.min_connections = cfg.min_connections;
    pool.max_connections = cfg.max_connections;
    pool.acquire_timeout = cfg.acquire_timeout;
    pool.idle_timeout = cfg.idle_timeout;
    pool.health_check_query = cfg.health_check_query;
    pool.max_lifetime = cfg.max_lifetime;
    return pool;
}

} // namespace

DriverRegistry DriverRegistry::with_builtin_drivers() {
    DriverRegistry registry;

    registry.register_driver(DatabaseType::POSTGRESQL,
        [](const DriverConfig& cfg, InstrumentationOptions instr) -> std::unique_ptr<Driver> {
            PgDriverOptions options;
            options.pool = pool_config(cfg);
            options.pgvector = cfg.pgvector;
            options.postgis = cfg.postgis;
            return std::make_unique<PgDriver>(std::move(options), std::move(instr), cfg.name);
        });

    registry.register_driver(DatabaseType::MYSQL,
        [](const DriverConfig& cfg, InstrumentationOptions instr) -> std::unique_ptr<Driver> {
            MysqlDriverOptions options;
            options.pool = pool_config(cfg);
            return std::make_unique<MysqlDriver>(std::move(options), std::move(instr), cfg.name);
        });

    registry.register_driver(DatabaseType::SQLITE,
        [](const DriverConfig& cfg, InstrumentationOptions instr) -> std::unique_ptr<Driver> {
            SqliteOptions options;
            options.filename = cfg.filename;
            options.read_only = cfg.read_only;
            options.busy_timeout = cfg.busy_timeout;
            options.foreign_keys = cfg.foreign_keys;
            return std::make_unique<SqliteDriver>(std::move(options), std::move(instr), cfg.name);
        });

    registry.register_driver(DatabaseType::D1_HTTP,
        [](const DriverConfig& cfg, InstrumentationOptions instr) -> std::unique_ptr<Driver> {
            D1Options options;
            options.account_id = cfg.account_id;
            options.database_id = cfg.database_id;
            options.api_token = cfg.api_token;
            options.base_url = cfg.base_url;
            options.timeout = cfg.request_timeout;
            return std::make_unique<D1HttpDriver>(std::move(options), std::move(instr), cfg.name);
        });

    return registry;
}

std::unique_ptr<Driver> DriverRegistry::create(const DriverConfig& config,
                                               InstrumentationOptions instrumentation) const {
    const auto it = factories_.find(config.type);
    if (it == factories_.end()) {
        throw DriverError(std::format("No driver registered for type: {}",
                                      database_type_to_string(config.type)));
    }
    return it->second(config, std::move(instrumentation));
}

InstrumentationOptions make_instrumentation(const ClientConfig& config,
                                            std::shared_ptr<ITracer> tracer) {
    InstrumentationOptions options;
    if (config.logging.level != LogLevel::NONE) {
        options.logger = std::make_shared<StderrQueryLogger>(config.logging.level,
                                                             config.logging.include_params);
    }
    if (config.tracing.enabled) {
        options.tracer = std::move(tracer);
    }
    options.include_sql = config.tracing.include_sql;
    options.include_params = config.logging.include_params;
    return options;
}

} // namespace unisql
