#include "tracing/instrumentation.hpp"

#include <format>

namespace unisql {

SpanAttributes Instrumentation::attributes(Dialect dialect, std::string_view driver,
                                           const QueryContext& context) const {
    SpanAttributes attrs;
    attrs["db.system"] = std::string(dialect_to_string(dialect));
    attrs["db.driver"] = std::string(driver);
    if (!context.model.empty()) {
        attrs["db.collection"] = context.model;
    }
    if (context.operation != Operation::NONE) {
        attrs["db.operation.name"] = std::string(operation_to_string(context.operation));
    }
    return attrs;
}

SpanAttributes Instrumentation::query_attributes(Dialect dialect, std::string_view driver,
                                                 const QueryContext& context,
                                                 std::string_view sql,
                                                 const Params& params) const {
    auto attrs = attributes(dialect, driver, context);
    if (options_.include_sql && !sql.empty()) {
        attrs["db.query.text"] = std::string(sql);
    }
    if (options_.include_params && !params.empty()) {
        attrs["db.query.parameters"] = params_to_display(params);
    }
    return attrs;
}

void Instrumentation::warn(std::string_view driver, const QueryContext& context,
                           std::string message) const {
    if (!options_.logger) {
        utils::log::warn(std::format("[unisql:{}] {}", driver, message));
        return;
    }
    QueryLogEvent event;
    event.level = LogLevel::WARNING;
    event.timestamp = utils::now();
    event.driver = std::string(driver);
    event.model = context.model;
    event.operation = context.operation;
    event.message = std::move(message);
    emit(event);
}

void Instrumentation::log_success(const QueryLogEvent& event,
                                  std::chrono::microseconds duration) const {
    if (!options_.logger || event.sql.empty()) return;
    QueryLogEvent out = event;
    out.level = LogLevel::QUERY;
    out.timestamp = utils::now();
    out.duration = duration;
    emit(out);
}

void Instrumentation::log_failure(QueryLogEvent event, std::chrono::microseconds duration,
                                  const DriverError& error) const {
    if (error.logged()) return;
    error.mark_logged();
    if (!options_.logger) return;

    event.level = LogLevel::ERROR;
    event.timestamp = utils::now();
    event.duration = duration;
    event.error_type = error.kind();
    event.error_message = error.what();
    event.error_code = error.code();
    emit(event);
}

void Instrumentation::emit(const QueryLogEvent& event) const {
    try {
        options_.logger->log(event);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("[unisql:{}] query logger failed: {}", event.driver, e.what()));
    }
}

} // namespace unisql
