#include "core/error.hpp"

#include <array>
#include <format>

namespace unisql {

DriverError::DriverError(const std::string& message, std::string code,
                         std::exception_ptr cause, std::string cause_message)
    : std::runtime_error(message),
      code_(std::move(code)),
      cause_(std::move(cause)),
      cause_message_(std::move(cause_message)) {}

QueryError::QueryError(const std::string& message, std::string query, Params params,
                       std::string code, std::exception_ptr cause, std::string cause_message)
    : DriverError(message, std::move(code), std::move(cause), std::move(cause_message)),
      query_(std::move(query)),
      params_(std::move(params)) {}

UniqueConstraintError::UniqueConstraintError(const std::string& message, std::string query,
                                             Params params, std::string code, ConstraintInfo info)
    : QueryError(message, std::move(query), std::move(params), std::move(code)),
      info_(std::move(info)) {}

ForeignKeyError::ForeignKeyError(const std::string& message, std::string query,
                                 Params params, std::string code, ConstraintInfo info)
    : QueryError(message, std::move(query), std::move(params), std::move(code)),
      info_(std::move(info)) {}

FeatureNotSupportedError::FeatureNotSupportedError(std::string feature, std::string method,
                                                   std::string suggestion)
    : DriverError(suggestion.empty()
                      ? std::format("Feature '{}' is not supported ({})", feature, method)
                      : std::format("Feature '{}' is not supported ({}). {}", feature, method, suggestion),
                  "FEATURE_NOT_SUPPORTED"),
      feature_(std::move(feature)),
      method_(std::move(method)),
      suggestion_(std::move(suggestion)) {}

bool is_retryable_code(std::string_view code) noexcept {
    static constexpr std::array<std::string_view, 6> kRetryable = {
        "40001",          // serialization_failure
        "40P01",          // deadlock_detected
        "SQLITE_BUSY",
        "SQLITE_LOCKED",
        "1213",           // ER_LOCK_DEADLOCK
        "1205",           // ER_LOCK_WAIT_TIMEOUT
    };
    for (const auto c : kRetryable) {
        if (code == c) return true;
    }
    // Extended SQLite codes: SQLITE_BUSY_SNAPSHOT, SQLITE_LOCKED_SHAREDCACHE, ...
    return code.starts_with("SQLITE_BUSY_") || code.starts_with("SQLITE_LOCKED_");
}

bool is_retryable(const DriverError& error) noexcept {
    return is_retryable_code(error.code());
}

} // namespace unisql
