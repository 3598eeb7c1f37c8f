#include "agent/agent.hpp"
#include "config/config_loader.hpp"
#include "core/url_utils.hpp"
#include "core/utils.hpp"
#include "metrics/metric_names.hpp"
#include "metrics/recorders.hpp"
#include "propagation/hashes.hpp"

#include <atomic>
#include <format>

namespace apmcore {

Agent::Agent(AgentConfig config)
    : config_(std::move(config)),
      server_settings_(std::make_shared<const ServerSettings>()),
      hooks_(tracer_) {
    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    } else {
        utils::log::warn(std::format("Unknown log level '{}', keeping the current level",
                                     config_.logging.level));
    }

    if (!config_.server_settings.is_null() && !apply_server_settings(config_.server_settings)) {
        utils::log::warn("Ignoring [server] settings from the local configuration");
    }

    utils::log::info(std::format("Agent started for {} (distributed tracing: {}, CAT: {})",
                                 config_.primary_application(),
                                 utils::booltostr(distributed_tracing_enabled()),
                                 utils::booltostr(cat_enabled())));
}

// ============================================================================
// Server settings
// ============================================================================

std::shared_ptr<const ServerSettings> Agent::server_settings() const {
    return std::atomic_load_explicit(&server_settings_, std::memory_order_acquire);
}

bool Agent::apply_server_settings(const nlohmann::json& settings) {
    auto parsed = ConfigLoader::parse_server_settings(settings);
    if (parsed.is_error()) {
        utils::log::warn(std::format("Rejected server settings ({}): {}",
                                     error_category_to_string(parsed.error_category()),
                                     parsed.error_message()));
        return false;
    }

    auto next = std::make_shared<ServerSettings>(std::move(parsed.value()));
    if (next->encoding_key && next->cross_process_id) {
        next->obfuscated_id = hashes::obfuscate_name_using_key(*next->cross_process_id,
                                                               *next->encoding_key);
    }

    if (const auto terms = settings.find("transaction_segment_terms"); terms != settings.end()) {
        segment_normalizer_.load(*terms);
    }

    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        std::atomic_store_explicit(&server_settings_,
                                   std::shared_ptr<const ServerSettings>(std::move(next)),
                                   std::memory_order_release);
    }

    utils::log::debug("Applied server settings");
    return true;
}

// ============================================================================
// Transactions
// ============================================================================

std::shared_ptr<Transaction> Agent::start_transaction(TransactionType type, std::string name) {
    auto tx = Transaction::create(
        type,
        [this](Transaction& transaction) { finalize_transaction(transaction); },
        [this](const Transaction& transaction) { publish_transaction(transaction); });
    if (!name.empty()) {
        tx->set_name(std::move(name));
    }
    utils::log::trace(std::format("Started transaction {}", tx->id()));
    return tx;
}

void Agent::set_transaction_sink(std::shared_ptr<ITransactionSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void Agent::finalize_transaction(Transaction& transaction) {
    // HTTP status errors
    if (transaction.type() == TransactionType::WEB && config_.error_collector.enabled) {
        if (const auto code = transaction.status_code();
            code && url::is_error(&config_.error_collector, *code)) {
            transaction.notice_error(std::format("HTTP Error {}", *code));
        }
    }

    // Segment term rules
    if (const auto full_name = transaction.full_name(); !full_name.empty()) {
        const auto result = segment_normalizer_.normalize(full_name);
        if (result.matched && result.value != full_name) {
            const std::string_view prefix = transaction.type() == TransactionType::WEB
                ? metric_names::kWebTransactionPrefix
                : metric_names::kOtherTransactionPrefix;
            if (std::string_view(result.value).starts_with(prefix)) {
                transaction.set_name(result.value.substr(prefix.size()));
            } else {
                utils::log::debug(std::format("Normalized name {} lost its {} prefix, not renaming",
                                              result.value, prefix));
            }
        }
    }

    transaction.for_each_segment([this](Segment& segment) {
        auto result = segment_normalizer_.normalize(segment.name());
        if (result.matched) segment.set_name(std::move(result.value));
    });

    // Metrics
    transaction.for_each_segment([&](Segment& segment) {
        const auto recorder = segment.recorder();
        if (!recorder) return;
        try {
            recorder(segment, transaction, metrics_);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Recording segment {} failed: {}", segment.name(), e.what()));
        }
    });

    if (const auto full_name = transaction.full_name(); !full_name.empty()) {
        metrics_.measure(full_name, transaction.duration(),
                         recorders::exclusive_duration(*transaction.root_segment()));
    }
}

void Agent::publish_transaction(const Transaction& transaction) {
    std::shared_ptr<ITransactionSink> sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink) return;

    try {
        sink->consume(transaction, metrics_);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Transaction sink {} failed: {}", sink->name(), e.what()));
    }
}

} // namespace apmcore
