#pragma once

#include "agent/itransaction_sink.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "instrumentation/hook_registry.hpp"
#include "metrics/metric_aggregator.hpp"
#include "metrics/segment_normalizer.hpp"
#include "tracing/tracer.hpp"
#include "tracing/transaction.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace apmcore {

/**
 * @brief Process-wide tracing agent
 *
 * Owns the immutable local configuration, the collector-supplied settings
 * snapshot, the segment term rules, the metric table and the hook
 * registry. Transactions started here call back into the agent when they
 * end, so the agent must outlive every transaction it starts.
 *
 * Thread-safety: server settings and term rules are hot-reloadable via RCU
 * (atomic shared_ptr); everything else is internally synchronized.
 */
class Agent {
public:
    explicit Agent(AgentConfig config);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    [[nodiscard]] const AgentConfig& config() const { return config_; }
    [[nodiscard]] const Tracer& tracer() const { return tracer_; }

    [[nodiscard]] std::shared_ptr<const ServerSettings> server_settings() const;

    /**
     * @brief Apply a collector settings document
     *
     * Validated before anything is swapped in; on error the previous
     * settings and term rules stay in place. transaction_segment_terms,
     * when present, reloads the segment normalizer.
     *
     * @return false when the document was rejected
     */
    bool apply_server_settings(const nlohmann::json& settings);

    [[nodiscard]] bool distributed_tracing_enabled() const {
        return config_.distributed_tracing_enabled;
    }
    [[nodiscard]] bool cat_enabled() const { return config_.cross_application_tracer_enabled; }

    [[nodiscard]] SegmentNormalizer& segment_normalizer() { return segment_normalizer_; }
    [[nodiscard]] const SegmentNormalizer& segment_normalizer() const { return segment_normalizer_; }

    [[nodiscard]] MetricAggregator& metrics() { return metrics_; }
    [[nodiscard]] const MetricAggregator& metrics() const { return metrics_; }

    [[nodiscard]] HookRegistry& hooks() { return hooks_; }

    /**
     * @brief Start a transaction (not yet ambient)
     *
     * Make it ambient with tracer().run_in_segment(tx->root_segment(), ...)
     * or a ContextScope.
     */
    [[nodiscard]] std::shared_ptr<Transaction> start_transaction(TransactionType type,
                                                                 std::string name = {});

    void set_transaction_sink(std::shared_ptr<ITransactionSink> sink);

private:
    void finalize_transaction(Transaction& transaction);
    void publish_transaction(const Transaction& transaction);

    const AgentConfig config_;
    Tracer tracer_;

    std::shared_ptr<const ServerSettings> server_settings_;
    std::mutex settings_mutex_;

    SegmentNormalizer segment_normalizer_;
    MetricAggregator metrics_;
    HookRegistry hooks_;

    std::shared_ptr<ITransactionSink> sink_;
    mutable std::mutex sink_mutex_;
};

} // namespace apmcore
