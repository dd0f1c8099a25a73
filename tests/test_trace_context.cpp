#include <catch2/catch_test_macros.hpp>
#include "mocks/mock_driver.hpp"
#include "tracing/span.hpp"
#include "tracing/trace_context.hpp"

using namespace unisql;
using namespace unisql::testing;

namespace {

constexpr const char* kTraceparent = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";

} // namespace

// ============================================================================
// traceparent parsing
// ============================================================================

TEST_CASE("TraceContext: parse valid traceparent", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(kTraceparent);

    REQUIRE(ctx.has_value());
    CHECK(ctx->trace_id == "4bf92f3577b34da6a3ce929d0e0e4736");
    CHECK(ctx->parent_span_id == "00f067aa0ba902b7");
    CHECK(ctx->is_sampled());
    CHECK(ctx->span_id == ctx->parent_span_id);
    CHECK(ctx->is_valid());
}

TEST_CASE("TraceContext: unsampled flag is kept", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00");
    REQUIRE(ctx.has_value());
    CHECK_FALSE(ctx->is_sampled());
}

TEST_CASE("TraceContext: malformed headers are rejected", "[tracing]") {
    const char* bad[] = {
        "01-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01",   // version
        "00-abcd-1234-01",                                           // length
        "00-00000000000000000000000000000000-00f067aa0ba902b7-01",   // zero trace id
        "00-4bf92f3577b34da6a3ce929d0e0e4736-0000000000000000-01",   // zero parent id
        "00-zzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz-00f067aa0ba902b7-01",   // hex
        "00_4bf92f3577b34da6a3ce929d0e0e4736_00f067aa0ba902b7_01",   // separators
    };
    for (const auto* header : bad) {
        INFO(header);
        CHECK_FALSE(TraceContext::parse_traceparent(header).has_value());
    }
}

TEST_CASE("TraceContext: generated header continues the same trace", "[tracing]") {
    auto original = TraceContext::generate();
    REQUIRE(original.is_valid());

    auto header = original.to_traceparent();
    CHECK(header.size() == 55);

    auto parsed = TraceContext::parse_traceparent(header);
    REQUIRE(parsed.has_value());
    CHECK(parsed->trace_id == original.trace_id);
    CHECK(parsed->parent_span_id == original.span_id);
}

// ============================================================================
// Active context
// ============================================================================

TEST_CASE("ScopedTraceContext: sets and restores the thread's context", "[tracing]") {
    CHECK_FALSE(TraceContext::current().has_value());

    auto outer = TraceContext::generate();
    {
        ScopedTraceContext scope(outer);
        REQUIRE(TraceContext::current().has_value());
        CHECK(TraceContext::current()->span_id == outer.span_id);

        auto inner = TraceContext::generate();
        {
            ScopedTraceContext nested(inner);
            CHECK(TraceContext::current()->span_id == inner.span_id);
        }
        CHECK(TraceContext::current()->span_id == outer.span_id);
    }
    CHECK_FALSE(TraceContext::current().has_value());
}

TEST_CASE("ScopedTraceContext: driver spans join an incoming trace", "[tracing]") {
    auto tracer = std::make_shared<InMemoryTracer>();
    MockDriver db({}, InstrumentationOptions{.tracer = tracer});

    auto incoming = TraceContext::parse_traceparent(kTraceparent);
    REQUIRE(incoming.has_value());
    {
        ScopedTraceContext scope(*incoming);
        db.execute_raw("SELECT 1");
    }

    const auto spans = tracer->spans_named("unisql.execute");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].trace_id == incoming->trace_id);
    CHECK(spans[0].parent_span_id == incoming->span_id);

    db.execute_raw("SELECT 2");
    const auto roots = tracer->spans_named("unisql.execute");
    REQUIRE(roots.size() == 2);
    CHECK(roots[1].parent_span_id.empty());
    CHECK(roots[1].trace_id != incoming->trace_id);
}
