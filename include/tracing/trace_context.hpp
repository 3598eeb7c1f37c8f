#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apmcore {

/**
 * @brief W3C Trace Context carried by a transaction
 *
 * Format: "00-{trace_id}-{parent_id}-{flags}"
 *   trace_id: 32 hex chars (128-bit)
 *   parent_id: 16 hex chars (64-bit), the id of the calling segment
 *   flags: 2 hex chars (8-bit, 01 = sampled)
 *
 * A transaction either starts a new trace (generate) or continues the trace
 * of an inbound request (parse_traceparent). Outbound calls render the
 * header with the id of the segment making the call as parent.
 */
struct TraceContext {
    std::string trace_id;        // 32 hex chars
    std::string parent_span_id;  // 16 hex chars, from inbound traceparent (empty for new traces)
    uint8_t trace_flags = 1;     // 01 = sampled
    std::string tracestate;      // opaque vendor state, propagated as-is

    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_sampled() const { return (trace_flags & 0x01) != 0; }

    /// Fresh trace (new trace_id, no parent)
    [[nodiscard]] static TraceContext generate();

    /// Parse W3C traceparent header: "00-{trace_id}-{parent_id}-{flags}"
    [[nodiscard]] static std::optional<TraceContext> parse_traceparent(std::string_view header);

    /// Render the traceparent for an outbound call made by `span_id`
    [[nodiscard]] std::string to_traceparent(std::string_view span_id) const;

    /// Random 32-hex-char trace id
    [[nodiscard]] static std::string generate_trace_id();
};

} // namespace apmcore
