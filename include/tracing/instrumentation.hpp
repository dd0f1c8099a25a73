#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "tracing/query_logger.hpp"
#include "tracing/span.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace unisql {

struct InstrumentationOptions {
    std::shared_ptr<ITracer> tracer;
    std::shared_ptr<IQueryLogger> logger;
    bool include_sql = true;      // db.query.text on spans
    bool include_params = false;  // db.query.parameters on spans
};

/**
 * @brief Side-channel observability around driver calls
 *
 * traced() wraps a call in a span when a tracer is configured and runs it
 * directly otherwise. logged() emits a QUERY record on success and one ERROR
 * record per DriverError, however many layers it travels through. Neither
 * changes the wrapped call's return value or the type of what it throws: a
 * logger or tracer that throws is reported through utils::log and otherwise
 * ignored.
 */
class Instrumentation {
public:
    Instrumentation() = default;
    explicit Instrumentation(InstrumentationOptions options)
        : options_(std::move(options)) {}

    [[nodiscard]] const InstrumentationOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool has_tracer() const noexcept { return options_.tracer != nullptr; }

    /**
     * @brief Standard attributes: db.system, db.driver, and from the context
     * db.collection and db.operation.name
     */
    [[nodiscard]] SpanAttributes attributes(Dialect dialect, std::string_view driver,
                                            const QueryContext& context) const;

    /**
     * @brief attributes() plus db.query.text / db.query.parameters
     */
    [[nodiscard]] SpanAttributes query_attributes(Dialect dialect, std::string_view driver,
                                                  const QueryContext& context,
                                                  std::string_view sql,
                                                  const Params& params) const;

    template <typename Fn>
    auto traced(std::string name, SpanAttributes attrs, Fn&& fn) const -> std::invoke_result_t<Fn&> {
        if (!options_.tracer) {
            return fn();
        }
        ScopedSpan span(*options_.tracer, std::move(name), std::move(attrs));
        try {
            return fn();
        } catch (const std::exception& e) {
            span.record_error(e);
            throw;
        }
    }

    /**
     * @brief Time fn and emit its log record
     *
     * A QUERY record is written on success only when event.sql is set, so
     * transaction scopes log their failures but not their completions.
     */
    template <typename Fn>
    auto logged(QueryLogEvent event, Fn&& fn) const -> std::invoke_result_t<Fn&> {
        utils::Timer timer;
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
                fn();
                log_success(event, timer.elapsed_us());
            } else {
                auto result = fn();
                log_success(event, timer.elapsed_us());
                return result;
            }
        } catch (const DriverError& e) {
            log_failure(std::move(event), timer.elapsed_us(), e);
            throw;
        }
    }

    /**
     * @brief Structured warning; falls back to utils::log without a logger
     */
    void warn(std::string_view driver, const QueryContext& context, std::string message) const;

private:
    void log_success(const QueryLogEvent& event, std::chrono::microseconds duration) const;
    void log_failure(QueryLogEvent event, std::chrono::microseconds duration,
                     const DriverError& error) const;

    /// Hand event to the logger; a failing logger never reaches the caller
    void emit(const QueryLogEvent& event) const;

    InstrumentationOptions options_;
};

} // namespace unisql
