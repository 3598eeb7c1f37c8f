#include "metrics/recorders.hpp"
#include "metrics/metric_aggregator.hpp"
#include "metrics/metric_names.hpp"
#include "tracing/transaction.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

namespace apmcore::recorders {

std::chrono::microseconds exclusive_duration(const Segment& segment) {
    using std::chrono::microseconds;

    const auto begin = segment.start_time();
    const auto end = begin + segment.duration();

    // Children may overlap (concurrent calls), so subtract the union of their
    // intervals clipped to this segment.
    std::vector<std::pair<Segment::Clock::time_point, Segment::Clock::time_point>> intervals;
    for (const auto& child : segment.children()) {
        const auto child_begin = std::max(child->start_time(), begin);
        const auto child_end = std::min(child->start_time() + child->duration(), end);
        if (child_begin < child_end) intervals.emplace_back(child_begin, child_end);
    }
    std::sort(intervals.begin(), intervals.end());

    microseconds covered{0};
    auto cursor = begin;
    for (const auto& [from, to] : intervals) {
        const auto start = std::max(from, cursor);
        if (to > start) {
            covered += std::chrono::duration_cast<microseconds>(to - start);
            cursor = to;
        }
    }

    return std::max(segment.duration() - covered, microseconds{0});
}

SegmentRecorder record_external(std::string host, std::string library) {
    return [host = std::move(host), library = std::move(library)](
               const Segment& segment, const Transaction& transaction, MetricAggregator& metrics) {
        const auto duration = segment.duration();
        const auto exclusive = exclusive_duration(segment);
        const auto metric_name = std::format("{}{}/{}", metric_names::kExternalPrefix, host, library);

        const auto scope = transaction.full_name();
        if (!scope.empty()) {
            metrics.measure_scoped(scope, metric_name, duration, exclusive);
        }
        metrics.measure(metric_name, duration, exclusive);
        metrics.measure(std::format("{}{}{}", metric_names::kExternalPrefix, host,
                                    metric_names::kAllSuffix),
                        duration, exclusive);
        metrics.measure(metric_names::kExternalAll, duration, exclusive);
        metrics.measure(transaction.type() == TransactionType::WEB ? metric_names::kExternalAllWeb
                                                                   : metric_names::kExternalAllOther,
                        duration, exclusive);
    };
}

SegmentRecorder record_generic() {
    return [](const Segment& segment, const Transaction& transaction, MetricAggregator& metrics) {
        const auto duration = segment.duration();
        const auto exclusive = exclusive_duration(segment);
        const auto name = segment.name();

        const auto scope = transaction.full_name();
        if (!scope.empty()) {
            metrics.measure_scoped(scope, name, duration, exclusive);
        }
        metrics.measure(name, duration, exclusive);
    };
}

} // namespace apmcore::recorders
