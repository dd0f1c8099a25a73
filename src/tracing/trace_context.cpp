#include "tracing/trace_context.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <random>
#include <utility>

namespace unisql {

namespace {

constexpr size_t kTraceIdLen = 32;
constexpr size_t kSpanIdLen = 16;
constexpr size_t kTraceparentLen = 55;   // 2 + 1 + 32 + 1 + 16 + 1 + 2

// Lowercase hex is what we emit; incoming headers may use either case
bool is_hex_id(std::string_view s, size_t len) {
    if (s.size() != len) return false;
    bool nonzero = false;
    for (const char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        nonzero = nonzero || c != '0';
    }
    return nonzero;
}

std::string random_id(size_t hex_chars) {
    static constexpr std::array<char, 16> digits = {
        '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    static thread_local std::mt19937_64 gen{std::random_device{}()};

    std::string id;
    id.reserve(hex_chars);
    uint64_t bits = 0;
    for (size_t i = 0; i < hex_chars; ++i) {
        if (i % 16 == 0) bits = gen();
        id += digits[bits & 0xF];
        bits >>= 4;
    }
    // All-zero ids are invalid
    if (std::all_of(id.begin(), id.end(), [](char c) { return c == '0'; })) {
        id.back() = '1';
    }
    return id;
}

thread_local std::optional<TraceContext> t_active;

} // namespace

bool TraceContext::is_valid() const {
    return is_hex_id(trace_id, kTraceIdLen) && is_hex_id(span_id, kSpanIdLen);
}

TraceContext TraceContext::generate() {
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.span_id = generate_span_id();
    return ctx;
}

std::optional<TraceContext> TraceContext::parse_traceparent(std::string_view header) {
    if (header.size() < kTraceparentLen || !header.starts_with("00-")) {
        return std::nullopt;
    }
    if (header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }

    const auto trace_id = header.substr(3, kTraceIdLen);
    const auto parent_id = header.substr(36, kSpanIdLen);
    const auto flags = header.substr(53, 2);
    if (!is_hex_id(trace_id, kTraceIdLen) || !is_hex_id(parent_id, kSpanIdLen)) {
        return std::nullopt;
    }

    unsigned int flag_bits = 0;
    const auto [ptr, ec] = std::from_chars(flags.data(), flags.data() + flags.size(), flag_bits, 16);
    if (ec != std::errc{} || ptr != flags.data() + flags.size()) {
        return std::nullopt;
    }

    TraceContext ctx;
    ctx.trace_id = std::string(trace_id);
    ctx.parent_span_id = std::string(parent_id);
    // Spans started under this context become children of the caller's span
    ctx.span_id = ctx.parent_span_id;
    ctx.trace_flags = static_cast<uint8_t>(flag_bits);
    return ctx;
}

std::string TraceContext::to_traceparent() const {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out = "00-" + trace_id + "-" + span_id + "-";
    out += hex[trace_flags >> 4];
    out += hex[trace_flags & 0xF];
    return out;
}

std::string TraceContext::generate_span_id() {
    return random_id(kSpanIdLen);
}

std::string TraceContext::generate_trace_id() {
    return random_id(kTraceIdLen);
}

std::optional<TraceContext> TraceContext::current() {
    return t_active;
}

// ============================================================================
// ScopedTraceContext
// ============================================================================

ScopedTraceContext::ScopedTraceContext(const TraceContext& ctx)
    : previous_(std::exchange(t_active, ctx)) {}

ScopedTraceContext::~ScopedTraceContext() {
    t_active = std::move(previous_);
}

} // namespace unisql
