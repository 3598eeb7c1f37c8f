#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace apmcore {

// ============================================================================
// Attributes
// ============================================================================

/**
 * @brief Value of a segment attribute or span attribute
 *
 * Keep string literals out of the constructor: pass std::string explicitly so
 * the value never degrades to bool.
 */
using AttributeValue = std::variant<std::string, int64_t, double, bool>;

// Ordered so exported attributes have a stable layout
using AttributeMap = std::map<std::string, AttributeValue>;

// ============================================================================
// Header containers
// ============================================================================

// Ordered [name, value] pairs, duplicates allowed
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// name -> value mapping
using HeaderMap = std::map<std::string, std::string>;

/**
 * @brief Header container as supplied by the caller of an outbound request
 *
 * Either shape is accepted; instrumentation returns the same shape it got.
 */
using HeaderCarrier = std::variant<HeaderMap, HeaderList>;

// ============================================================================
// Transactions
// ============================================================================

enum class TransactionType {
    WEB,
    BACKGROUND
};

/**
 * @brief Which cross-process header family a transaction emits
 *
 * Chosen at the first outbound call and kept for the transaction's lifetime.
 */
enum class TraceHeaderMode {
    NONE,
    DISTRIBUTED_TRACING,
    CROSS_APPLICATION
};

[[nodiscard]] inline constexpr const char* header_mode_to_string(TraceHeaderMode mode) {
    switch (mode) {
        case TraceHeaderMode::DISTRIBUTED_TRACING: return "distributed_tracing";
        case TraceHeaderMode::CROSS_APPLICATION:   return "cross_application";
        case TraceHeaderMode::NONE:                return "none";
    }
    return "none";
}

} // namespace apmcore
