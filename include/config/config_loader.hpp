#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace apmcore {

// ============================================================================
// ConfigLoader - Extract typed config from agent.toml
// ============================================================================

/**
 * Recognised layout:
 *
 *   [agent]
 *   app_name = "checkout"            # or ["checkout", "rollup"]
 *
 *   [distributed_tracing]
 *   enabled = true
 *
 *   [cross_application_tracer]
 *   enabled = false
 *
 *   [error_collector]
 *   enabled = true
 *   ignore_status_codes = [404, 410]
 *
 *   [logging]
 *   level = "debug"
 *
 *   [server]                         # optional, offline collector settings
 *   encoding_key = "..."
 *   trusted_account_ids = [1, 2]
 *   cross_process_id = "1#42"
 *   [[server.transaction_segment_terms]]
 *   prefix = "WebTransaction/Uri/"
 *   terms = ["api", "v1"]
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AgentConfig config;

        static LoadResult ok(AgentConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to agent.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate the collector's settings document
     *
     * encoding_key and cross_process_id must be strings when present;
     * trusted_account_ids must be an array (non-integer entries are dropped
     * with a warning). transaction_segment_terms is left to the normalizer.
     */
    [[nodiscard]] static Result<ServerSettings> parse_server_settings(const nlohmann::json& settings);

    [[nodiscard]] static std::vector<std::string> validate_config(const AgentConfig& config);

private:
    static AgentConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AgentConfig config);

    static std::vector<std::string> extract_app_names(const toml::table& root);
    static ErrorCollectorConfig extract_error_collector(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static nlohmann::json extract_server(const toml::table& root);
};

} // namespace apmcore
