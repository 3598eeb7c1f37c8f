#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace apmcore {

namespace {

// ============================================================================
// TOML helpers
// ============================================================================

/**
 * @brief Substitute ${NAME} with the environment variable NAME (unset -> "")
 *
 * Lets secrets such as the encoding key stay out of the file.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            result.append(input, pos, std::string::npos);
            break;
        }
        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        result.append(input, pos, open - pos);
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) result += value;
        pos = close + 1;
    }
    return result;
}

void expand_env_vars_in(toml::node& node) {
    if (auto* tbl = node.as_table()) {
        for (auto&& [key, value] : *tbl) expand_env_vars_in(value);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_env_vars_in(elem);
    } else if (auto* str = node.as_string()) {
        str->get() = expand_env_vars(str->get());
    }
}

nlohmann::json toml_to_json(const toml::node& node) {
    if (const auto* tbl = node.as_table()) {
        auto obj = nlohmann::json::object();
        for (const auto& [key, value] : *tbl) {
            obj[std::string(key.str())] = toml_to_json(value);
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        auto out = nlohmann::json::array();
        for (const auto& elem : *arr) out.push_back(toml_to_json(elem));
        return out;
    }
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean()) return b->get();
    return nullptr;  // dates and times have no use here
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_in(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

std::vector<std::string> ConfigLoader::extract_app_names(const toml::table& root) {
    std::vector<std::string> names;
    const auto node = root["agent"]["app_name"];

    if (const auto* single = node.as_string()) {
        // "a;b" is accepted as a list, as with the other agents' config files
        for (auto& name : utils::split(single->get(), ';')) {
            if (!name.empty()) names.push_back(std::move(name));
        }
    } else if (const auto* arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string(); s && !s->get().empty()) {
                names.emplace_back(s->get());
            }
        }
    }
    return names;
}

ErrorCollectorConfig ConfigLoader::extract_error_collector(const toml::table& root) {
    ErrorCollectorConfig cfg;
    const auto ec = root["error_collector"];
    if (!ec) return cfg;

    cfg.enabled = ec["enabled"].value_or(true);
    if (const auto* codes = ec["ignore_status_codes"].as_array()) {
        cfg.ignore_status_codes.clear();
        for (const auto& elem : *codes) {
            if (const auto code = elem.value<int64_t>()) {
                cfg.ignore_status_codes.push_back(static_cast<int>(*code));
            }
        }
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    cfg.level = root["logging"]["level"].value_or("info"s);
    return cfg;
}

nlohmann::json ConfigLoader::extract_server(const toml::table& root) {
    if (const auto* server = root["server"].as_table()) {
        return toml_to_json(*server);
    }
    return nullptr;
}

AgentConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AgentConfig config;
    config.app_names = extract_app_names(root);
    config.distributed_tracing_enabled = root["distributed_tracing"]["enabled"].value_or(false);
    config.cross_application_tracer_enabled =
        root["cross_application_tracer"]["enabled"].value_or(true);
    config.error_collector = extract_error_collector(root);
    config.logging = extract_logging(root);
    config.server_settings = extract_server(root);
    return config;
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AgentConfig& config) {
    std::vector<std::string> errors;

    if (config.app_names.empty()) {
        errors.push_back("agent.app_name must name at least one application");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of trace, debug, info, "
                                     "warn, error", config.logging.level));
    }

    for (const int code : config.error_collector.ignore_status_codes) {
        if (code < 100 || code > 599) {
            errors.push_back(std::format(
                "error_collector.ignore_status_codes entry {} is not an HTTP status code", code));
        }
    }

    if (!config.server_settings.is_null()) {
        const auto server = parse_server_settings(config.server_settings);
        if (server.is_error()) {
            errors.push_back(std::format("server: {}", server.error_message()));
        }
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AgentConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

Result<ServerSettings> ConfigLoader::parse_server_settings(const nlohmann::json& settings) {
    if (!settings.is_object()) {
        return Result<ServerSettings>::error(
            ErrorCategory::CONFIG_ERROR,
            std::format("server settings must be an object, got {}", settings.type_name()));
    }

    ServerSettings out;

    if (const auto it = settings.find("encoding_key"); it != settings.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Result<ServerSettings>::error(ErrorCategory::CONFIG_ERROR,
                                                 "encoding_key must be a string");
        }
        if (!it->get_ref<const std::string&>().empty()) {
            out.encoding_key = it->get<std::string>();
        }
    }

    if (const auto it = settings.find("cross_process_id"); it != settings.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Result<ServerSettings>::error(ErrorCategory::CONFIG_ERROR,
                                                 "cross_process_id must be a string");
        }
        out.cross_process_id = it->get<std::string>();
    }

    if (const auto it = settings.find("trusted_account_ids"); it != settings.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Result<ServerSettings>::error(ErrorCategory::CONFIG_ERROR,
                                                 "trusted_account_ids must be an array");
        }
        std::vector<int64_t> ids;
        for (const auto& id : *it) {
            if (id.is_number_integer()) {
                ids.push_back(id.get<int64_t>());
            } else {
                utils::log::warn(std::format("Dropping non-integer trusted account id {}", id.dump()));
            }
        }
        out.trusted_account_ids = std::move(ids);
    }

    return Result<ServerSettings>::ok(std::move(out));
}

} // namespace apmcore
