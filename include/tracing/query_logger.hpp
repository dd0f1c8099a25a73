#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace unisql {

/**
 * @brief Severity of a structured query log record (ordered)
 */
enum class LogLevel {
    QUERY,      // every successful statement
    WARNING,    // degraded guarantees, ignored options
    ERROR,      // failed statements and transactions
    NONE        // logging disabled
};

[[nodiscard]] std::string_view log_level_to_string(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view str);

/**
 * @brief Structured record handed to IQueryLogger
 */
struct QueryLogEvent {
    LogLevel level = LogLevel::QUERY;
    std::chrono::system_clock::time_point timestamp;
    std::chrono::microseconds duration{0};
    std::string driver;
    std::string model;
    Operation operation = Operation::NONE;
    std::string sql;
    Params params;
    std::string error_type;
    std::string error_message;
    std::string error_code;
    std::string message;        // free-form text for warnings
};

class IQueryLogger {
public:
    virtual ~IQueryLogger() = default;
    virtual void log(const QueryLogEvent& event) = 0;
};

/**
 * @brief Renders records through utils::log (stderr)
 *
 * Records below min_level are dropped. Parameters are printed only with
 * include_params, since they may carry user data.
 */
class StderrQueryLogger : public IQueryLogger {
public:
    explicit StderrQueryLogger(LogLevel min_level = LogLevel::QUERY, bool include_params = false)
        : min_level_(min_level), include_params_(include_params) {}

    void log(const QueryLogEvent& event) override;

    /// Single-line rendering used by log()
    [[nodiscard]] std::string format(const QueryLogEvent& event) const;

private:
    LogLevel min_level_;
    bool include_params_;
};

} // namespace unisql
