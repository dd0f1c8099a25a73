#include "tracing/span.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace unisql {

namespace {

// A tracer that fails to start a span falls back to the default ids so the
// traced call still runs and still parents its children.
Span start_span_guarded(ITracer& tracer, const std::string& name,
                        const SpanAttributes& attributes) {
    try {
        return tracer.start_span(name, attributes);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Tracer failed to start span {}: {}", name, e.what()));
        return tracer.ITracer::start_span(name, attributes);
    }
}

} // namespace

Span ITracer::start_span(std::string name, SpanAttributes attributes) {
    Span span;
    span.name = std::move(name);
    span.attributes = std::move(attributes);
    span.span_id = TraceContext::generate_span_id();
    if (const auto parent = TraceContext::current()) {
        span.trace_id = parent->trace_id;
        span.parent_span_id = parent->span_id;
    } else {
        span.trace_id = TraceContext::generate_trace_id();
    }
    span.start_time = std::chrono::steady_clock::now();
    return span;
}

// ============================================================================
// ScopedSpan
// ============================================================================

ScopedSpan::ScopedSpan(ITracer& tracer, std::string name, SpanAttributes attributes)
    : tracer_(tracer),
      span_(start_span_guarded(tracer, name, attributes)),
      uncaught_at_start_(std::uncaught_exceptions()) {
    TraceContext ctx;
    ctx.trace_id = span_.trace_id;
    ctx.span_id = span_.span_id;
    ctx.parent_span_id = span_.parent_span_id;
    active_.emplace(ctx);
}

ScopedSpan::~ScopedSpan() {
    active_.reset();
    span_.end_time = std::chrono::steady_clock::now();
    if (span_.status == SpanStatus::UNSET) {
        // Ending during unwinding without record_error still counts as a failure
        span_.status = std::uncaught_exceptions() > uncaught_at_start_
            ? SpanStatus::ERROR : SpanStatus::OK;
    }
    try {
        tracer_.end_span(std::move(span_));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Tracer failed to record span: {}", e.what()));
    }
}

void ScopedSpan::record_error(const std::exception& e) {
    span_.status = SpanStatus::ERROR;
    span_.error_message = e.what();
    if (const auto* de = dynamic_cast<const DriverError*>(&e)) {
        span_.error_type = de->kind();
        if (!de->code().empty()) {
            span_.attributes["db.response.status_code"] = de->code();
        }
    } else {
        span_.error_type = "exception";
    }
}

void ScopedSpan::set_attribute(const std::string& key, std::string value) {
    span_.attributes[key] = std::move(value);
}

// ============================================================================
// InMemoryTracer
// ============================================================================

void InMemoryTracer::end_span(Span span) {
    std::lock_guard lock(mutex_);
    spans_.push_back(std::move(span));
}

std::vector<Span> InMemoryTracer::spans() const {
    std::lock_guard lock(mutex_);
    return spans_;
}

std::vector<Span> InMemoryTracer::spans_named(const std::string& name) const {
    std::lock_guard lock(mutex_);
    std::vector<Span> out;
    for (const auto& s : spans_) {
        if (s.name == name) out.push_back(s);
    }
    return out;
}

void InMemoryTracer::clear() {
    std::lock_guard lock(mutex_);
    spans_.clear();
}

} // namespace unisql
