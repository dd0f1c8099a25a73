#pragma once

#include "core/types.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace unisql {

/**
 * @brief Base of every error surfaced to callers
 *
 * code() carries the backend's machine-readable code (SQLSTATE, MySQL errno,
 * SQLite result code name) when one exists. cause() holds the exception that
 * was translated into this one, if any.
 *
 * The logged flag lets nested instrumentation layers emit one error record
 * per failure even when the error is rethrown through several of them.
 */
class DriverError : public std::runtime_error {
public:
    explicit DriverError(const std::string& message,
                         std::string code = {},
                         std::exception_ptr cause = nullptr,
                         std::string cause_message = {});

    [[nodiscard]] const std::string& code() const noexcept { return code_; }
    [[nodiscard]] std::exception_ptr cause() const noexcept { return cause_; }

    /// what() of the cause, or empty if there is none
    [[nodiscard]] const std::string& cause_message() const noexcept { return cause_message_; }

    /// Short type name used in log records
    [[nodiscard]] virtual const char* kind() const noexcept { return "DriverError"; }

    [[nodiscard]] bool logged() const noexcept { return logged_; }
    void mark_logged() const noexcept { logged_ = true; }

private:
    std::string code_;
    std::exception_ptr cause_;
    std::string cause_message_;
    mutable bool logged_ = false;
};

class ConnectionError : public DriverError {
public:
    using DriverError::DriverError;
    [[nodiscard]] const char* kind() const noexcept override { return "ConnectionError"; }
};

class QueryError : public DriverError {
public:
    QueryError(const std::string& message,
               std::string query,
               Params params = {},
               std::string code = {},
               std::exception_ptr cause = nullptr,
               std::string cause_message = {});

    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const Params& params() const noexcept { return params_; }
    [[nodiscard]] const char* kind() const noexcept override { return "QueryError"; }

private:
    std::string query_;
    Params params_;
};

/**
 * @brief Constraint metadata reported by the backend (fields may be empty)
 */
struct ConstraintInfo {
    std::string constraint;
    std::string table;
    std::vector<std::string> columns;
};

class UniqueConstraintError : public QueryError {
public:
    UniqueConstraintError(const std::string& message,
                          std::string query,
                          Params params,
                          std::string code,
                          ConstraintInfo info);

    [[nodiscard]] const std::string& constraint() const noexcept { return info_.constraint; }
    [[nodiscard]] const std::string& table() const noexcept { return info_.table; }
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return info_.columns; }
    [[nodiscard]] const char* kind() const noexcept override { return "UniqueConstraintError"; }

private:
    ConstraintInfo info_;
};

class ForeignKeyError : public QueryError {
public:
    ForeignKeyError(const std::string& message,
                    std::string query,
                    Params params,
                    std::string code,
                    ConstraintInfo info);

    [[nodiscard]] const std::string& constraint() const noexcept { return info_.constraint; }
    [[nodiscard]] const std::string& table() const noexcept { return info_.table; }
    [[nodiscard]] const char* kind() const noexcept override { return "ForeignKeyError"; }

private:
    ConstraintInfo info_;
};

class TransactionError : public DriverError {
public:
    using DriverError::DriverError;
    [[nodiscard]] const char* kind() const noexcept override { return "TransactionError"; }
};

/**
 * @brief Requested feature is unavailable on this driver
 *
 * Raised for missing transaction support (stateless HTTP backends) and for
 * optional extensions (vector, geospatial) that are not enabled.
 */
class FeatureNotSupportedError : public DriverError {
public:
    FeatureNotSupportedError(std::string feature,
                             std::string method,
                             std::string suggestion = {});

    [[nodiscard]] const std::string& feature() const noexcept { return feature_; }
    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::string& suggestion() const noexcept { return suggestion_; }
    [[nodiscard]] const char* kind() const noexcept override { return "FeatureNotSupportedError"; }

private:
    std::string feature_;
    std::string method_;
    std::string suggestion_;
};

// ============================================================================
// Retry classification
// ============================================================================

/**
 * @brief True for codes that indicate a transient conflict:
 * serialization failure (40001), deadlock (40P01, MySQL 1213),
 * lock wait timeout (MySQL 1205) and SQLITE_BUSY / SQLITE_LOCKED.
 */
[[nodiscard]] bool is_retryable_code(std::string_view code) noexcept;

[[nodiscard]] bool is_retryable(const DriverError& error) noexcept;

} // namespace unisql
