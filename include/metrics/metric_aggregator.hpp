#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace apmcore {

struct MetricStats {
    uint64_t call_count = 0;
    double total_seconds = 0.0;
    double exclusive_seconds = 0.0;
    double min_seconds = 0.0;
    double max_seconds = 0.0;

    void record(double duration_seconds, double exclusive);
};

/**
 * @brief Timeslice metric table
 *
 * Unscoped metrics are keyed by name. Scoped metrics are keyed by
 * (scope, name), where the scope is the owning transaction's full name.
 */
class MetricAggregator {
public:
    using ScopedKey = std::pair<std::string, std::string>;

    void measure(std::string_view name,
                 std::chrono::microseconds duration,
                 std::chrono::microseconds exclusive);

    void measure_scoped(std::string_view scope,
                        std::string_view name,
                        std::chrono::microseconds duration,
                        std::chrono::microseconds exclusive);

    [[nodiscard]] std::optional<MetricStats> get_unscoped(std::string_view name) const;
    [[nodiscard]] std::optional<MetricStats> get_scoped(std::string_view scope,
                                                        std::string_view name) const;

    [[nodiscard]] std::map<std::string, MetricStats> unscoped() const;
    [[nodiscard]] std::map<ScopedKey, MetricStats> scoped() const;

    [[nodiscard]] size_t size() const;
    void clear();

private:
    std::map<std::string, MetricStats, std::less<>> unscoped_;
    std::map<ScopedKey, MetricStats> scoped_;
    mutable std::shared_mutex mutex_;
};

} // namespace apmcore
