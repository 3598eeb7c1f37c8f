#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apmcore {

// ============================================================================
// Configuration Types
// ============================================================================

struct ErrorCollectorConfig {
    bool enabled = true;
    std::vector<int> ignore_status_codes{404};
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Local agent configuration (agent.toml)
 *
 * Loaded once at startup and immutable afterwards. Settings that the
 * collector pushes at runtime live in ServerSettings.
 */
struct AgentConfig {
    std::vector<std::string> app_names;

    bool distributed_tracing_enabled = false;
    bool cross_application_tracer_enabled = true;

    ErrorCollectorConfig error_collector;
    LoggingConfig logging;

    // Optional [server] block, same shape as the collector's settings
    // document; applied at agent start (offline use, tests)
    nlohmann::json server_settings;

    /// First configured application name, or "" when none
    [[nodiscard]] std::string primary_application() const {
        return app_names.empty() ? std::string{} : app_names.front();
    }
};

/**
 * @brief Settings supplied by the remote collector
 *
 * Every field is optional: a missing encoding key or trust list disables the
 * CAT features that need it. Published as an immutable snapshot and replaced
 * wholesale on each refresh.
 */
struct ServerSettings {
    std::optional<std::string> encoding_key;
    std::optional<std::vector<int64_t>> trusted_account_ids;
    std::optional<std::string> cross_process_id;

    // cross_process_id obfuscated with encoding_key, sent as x-newrelic-id
    std::optional<std::string> obfuscated_id;
};

} // namespace apmcore
