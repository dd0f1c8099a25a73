#include "tracing/query_logger.hpp"
#include "core/utils.hpp"

#include <format>

namespace unisql {

std::string_view log_level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::QUERY:   return "query";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR:   return "error";
        case LogLevel::NONE:    return "none";
    }
    return "none";
}

std::optional<LogLevel> parse_log_level(std::string_view str) {
    const auto lower = utils::to_lower(str);
    if (lower == "query" || lower == "info" || lower == "debug") return LogLevel::QUERY;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return std::nullopt;
}

std::string StderrQueryLogger::format(const QueryLogEvent& event) const {
    std::string out = std::format("[unisql:{}]", event.driver);
    if (!event.model.empty() || event.operation != Operation::NONE) {
        out += std::format(" {}.{}", event.model, operation_to_string(event.operation));
    }
    if (event.level == LogLevel::WARNING && !event.message.empty()) {
        out += ' ';
        out += event.message;
    }
    if (!event.sql.empty()) {
        out += std::format(" ({:.3f}ms) {}", event.duration.count() / 1000.0, event.sql);
    }
    if (include_params_ && !event.params.empty()) {
        out += ' ';
        out += params_to_display(event.params);
    }
    if (event.level == LogLevel::ERROR) {
        out += std::format(" failed: {}", event.error_message);
        if (!event.error_code.empty()) {
            out += std::format(" [{} {}]", event.error_type, event.error_code);
        } else if (!event.error_type.empty()) {
            out += std::format(" [{}]", event.error_type);
        }
    }
    return out;
}

void StderrQueryLogger::log(const QueryLogEvent& event) {
    if (min_level_ == LogLevel::NONE || event.level < min_level_) return;

    switch (event.level) {
        case LogLevel::QUERY:   utils::log::info(format(event)); break;
        case LogLevel::WARNING: utils::log::warn(format(event)); break;
        case LogLevel::ERROR:   utils::log::error(format(event)); break;
        case LogLevel::NONE:    break;
    }
}

} // namespace unisql
