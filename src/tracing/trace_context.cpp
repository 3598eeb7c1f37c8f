#include "tracing/trace_context.hpp"
#include "core/utils.hpp"

#include <format>

namespace apmcore {

namespace {

constexpr size_t kTraceIdLength = 32;
constexpr size_t kSpanIdLength = 16;
constexpr size_t kFlagsLength = 2;
constexpr size_t kTraceparentFields = 4;
constexpr size_t kTraceparentLength = 55;  // "00-" + trace id + '-' + span id + '-' + flags
constexpr std::string_view kSupportedVersion = "00";

bool is_valid_hex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

bool is_all_zeros(std::string_view s) {
    for (char c : s) {
        if (c != '0') return false;
    }
    return true;
}

} // anonymous namespace

bool TraceContext::is_valid() const {
    return trace_id.size() == kTraceIdLength && is_valid_hex(trace_id) && !is_all_zeros(trace_id);
}

TraceContext TraceContext::generate() {
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.trace_flags = 0x01;
    return ctx;
}

std::optional<TraceContext> TraceContext::parse_traceparent(std::string_view header) {
    // Version 00 has a fixed layout; longer values are only legal for later versions
    if (header.size() != kTraceparentLength) return std::nullopt;

    const auto fields = utils::split(header, '-');
    if (fields.size() != kTraceparentFields) return std::nullopt;

    const auto& version = fields[0];
    const auto& trace_id = fields[1];
    const auto& parent_id = fields[2];
    const auto& flags = fields[3];

    if (version != kSupportedVersion) return std::nullopt;
    if (trace_id.size() != kTraceIdLength || parent_id.size() != kSpanIdLength ||
        flags.size() != kFlagsLength) {
        return std::nullopt;
    }
    if (!is_valid_hex(trace_id) || is_all_zeros(trace_id)) return std::nullopt;
    if (!is_valid_hex(parent_id) || is_all_zeros(parent_id)) return std::nullopt;

    const auto flag_val = utils::try_parse_int<uint8_t>(flags, 16);
    if (!flag_val) return std::nullopt;

    TraceContext ctx;
    ctx.trace_id = utils::to_lower(trace_id);
    ctx.parent_span_id = utils::to_lower(parent_id);
    ctx.trace_flags = *flag_val;
    return ctx;
}

std::string TraceContext::to_traceparent(std::string_view span_id) const {
    return std::format("00-{}-{}-{:02x}", trace_id, span_id, trace_flags);
}

std::string TraceContext::generate_trace_id() {
    return utils::random_hex(16);
}

} // namespace apmcore
