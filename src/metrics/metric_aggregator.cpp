#include "metrics/metric_aggregator.hpp"

#include <algorithm>
#include <mutex>

namespace apmcore {

namespace {

double to_seconds(std::chrono::microseconds us) {
    return std::chrono::duration<double>(us).count();
}

} // anonymous namespace

void MetricStats::record(double duration_seconds, double exclusive) {
    if (call_count == 0) {
        min_seconds = duration_seconds;
        max_seconds = duration_seconds;
    } else {
        min_seconds = std::min(min_seconds, duration_seconds);
        max_seconds = std::max(max_seconds, duration_seconds);
    }
    ++call_count;
    total_seconds += duration_seconds;
    exclusive_seconds += exclusive;
}

void MetricAggregator::measure(std::string_view name,
                               std::chrono::microseconds duration,
                               std::chrono::microseconds exclusive) {
    std::unique_lock lock(mutex_);
    auto it = unscoped_.find(name);
    if (it == unscoped_.end()) {
        it = unscoped_.emplace(std::string(name), MetricStats{}).first;
    }
    it->second.record(to_seconds(duration), to_seconds(exclusive));
}

void MetricAggregator::measure_scoped(std::string_view scope,
                                      std::string_view name,
                                      std::chrono::microseconds duration,
                                      std::chrono::microseconds exclusive) {
    std::unique_lock lock(mutex_);
    scoped_[ScopedKey{std::string(scope), std::string(name)}]
        .record(to_seconds(duration), to_seconds(exclusive));
}

std::optional<MetricStats> MetricAggregator::get_unscoped(std::string_view name) const {
    std::shared_lock lock(mutex_);
    const auto it = unscoped_.find(name);
    if (it == unscoped_.end()) return std::nullopt;
    return it->second;
}

std::optional<MetricStats> MetricAggregator::get_scoped(std::string_view scope,
                                                        std::string_view name) const {
    std::shared_lock lock(mutex_);
    const auto it = scoped_.find(ScopedKey{std::string(scope), std::string(name)});
    if (it == scoped_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, MetricStats> MetricAggregator::unscoped() const {
    std::shared_lock lock(mutex_);
    return {unscoped_.begin(), unscoped_.end()};
}

std::map<MetricAggregator::ScopedKey, MetricStats> MetricAggregator::scoped() const {
    std::shared_lock lock(mutex_);
    return scoped_;
}

size_t MetricAggregator::size() const {
    std::shared_lock lock(mutex_);
    return unscoped_.size() + scoped_.size();
}

void MetricAggregator::clear() {
    std::unique_lock lock(mutex_);
    unscoped_.clear();
    scoped_.clear();
}

} // namespace apmcore
