#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace apmcore::url {

/**
 * @brief Result of splitting a request URL for naming and attributes
 */
struct ParsedUrl {
    std::string protocol;     // "http:", "https:" or "" for relative URLs
    std::string path;         // scrubbed path (see scrub)
    AttributeMap parameters;  // query parameters, value-less keys are `true`
};

/**
 * @brief Reduce a URL to its path
 *
 * Drops scheme, authority, query string, fragment and `;` path parameters,
 * and a trailing slash on anything but the root. Returns "/" when the URL
 * has no path starting with a slash.
 */
[[nodiscard]] std::string scrub(std::string_view url);

/**
 * @brief Parse the query string of a URL
 *
 * "/status?v" -> {v: true}; "/status?v=1" -> {v: "1"}. Values are
 * percent-decoded and '+' is read as a space. A later duplicate key wins.
 */
[[nodiscard]] AttributeMap parse_parameters(std::string_view url);

/// Protocol, scrubbed path and parameters in one pass
[[nodiscard]] ParsedUrl scrub_and_parse_parameters(std::string_view url);

/**
 * @brief True when the status code should be ignored by the error collector
 *
 * Only codes >= 400 can be ignored.
 */
[[nodiscard]] bool is_ignored_error(const ErrorCollectorConfig* config, int status_code);
[[nodiscard]] bool is_ignored_error(const ErrorCollectorConfig* config, std::string_view status_code);

/**
 * @brief True for HTTP status codes >= 400 that are not ignored
 *
 * A null config means "nothing ignored". Unparsable strings are never errors.
 */
[[nodiscard]] bool is_error(const ErrorCollectorConfig* config, int status_code);
[[nodiscard]] bool is_error(const ErrorCollectorConfig* config, std::string_view status_code);

/**
 * @brief Copy entries from source into dest without overwriting existing keys
 */
void copy_parameters(const AttributeMap& source, AttributeMap& dest);

} // namespace apmcore::url
