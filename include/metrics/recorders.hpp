#pragma once

#include "tracing/segment.hpp"

#include <chrono>
#include <string>

namespace apmcore::recorders {

/// Segment duration minus the time covered by its children, floored at zero
[[nodiscard]] std::chrono::microseconds exclusive_duration(const Segment& segment);

/**
 * @brief Recorder for outbound calls to `host` made through `library`
 *
 * Records External/<host>/<library> (scoped and unscoped),
 * External/<host>/all, External/all and External/allWeb or
 * External/allOther depending on the transaction type.
 */
[[nodiscard]] SegmentRecorder record_external(std::string host, std::string library);

/// Recorder that emits one scoped and unscoped metric under the segment's own name
[[nodiscard]] SegmentRecorder record_generic();

} // namespace apmcore::recorders
