#pragma once

#include "tracing/trace_context.hpp"

#include <chrono>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace unisql {

using SpanAttributes = std::map<std::string, std::string>;

enum class SpanStatus {
    UNSET,
    OK,
    ERROR
};

/**
 * @brief One traced driver operation (connect, execute, transaction, ...)
 */
struct Span {
    std::string trace_id;       // 32 hex chars
    std::string span_id;        // 16 hex chars (unique per span)
    std::string parent_span_id; // empty for a root span
    std::string name;           // e.g. "unisql.execute"
    SpanAttributes attributes;
    SpanStatus status = SpanStatus::UNSET;
    std::string error_type;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;

    /// Duration in microseconds
    [[nodiscard]] uint64_t duration_us() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                end_time - start_time).count());
    }

    [[nodiscard]] const std::string* attribute(const std::string& key) const {
        const auto it = attributes.find(key);
        return it != attributes.end() ? &it->second : nullptr;
    }
};

/**
 * @brief Tracer sink injected into drivers
 *
 * start_span() fills in ids, parenting the new span under the innermost
 * active span on the calling thread. end_span() receives the finished span.
 */
class ITracer {
public:
    virtual ~ITracer() = default;

    [[nodiscard]] virtual Span start_span(std::string name, SpanAttributes attributes);

    virtual void end_span(Span span) = 0;
};

/**
 * @brief RAII span helper: starts on construction, ends on destruction
 *
 * While alive the span is the active parent on this thread, so nested
 * operations (statements inside a transaction) become its children.
 *
 * Usage:
 *   ScopedSpan span(tracer, "unisql.execute", attrs);
 *   try { ... } catch (const std::exception& e) { span.record_error(e); throw; }
 */
class ScopedSpan {
public:
    ScopedSpan(ITracer& tracer, std::string name, SpanAttributes attributes);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void record_error(const std::exception& e);
    void set_attribute(const std::string& key, std::string value);

    [[nodiscard]] const Span& span() const { return span_; }

private:
    ITracer& tracer_;
    Span span_;
    int uncaught_at_start_;
    std::optional<ScopedTraceContext> active_;
};

/**
 * @brief Tracer that keeps finished spans in memory (thread-safe)
 */
class InMemoryTracer : public ITracer {
public:
    void end_span(Span span) override;

    [[nodiscard]] std::vector<Span> spans() const;
    [[nodiscard]] std::vector<Span> spans_named(const std::string& name) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Span> spans_;
};

} // namespace unisql
