#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apmcore {

class OutboundHeaders;
class Segment;
class Transaction;

namespace cat {

// ============================================================================
// Legacy cross application tracing (CAT) headers
// ============================================================================

inline constexpr std::string_view kIdHeader = "x-newrelic-id";
inline constexpr std::string_view kTransactionHeader = "x-newrelic-transaction";
inline constexpr std::string_view kSyntheticsHeader = "x-newrelic-synthetics";
inline constexpr std::string_view kAppDataHeader = "x-newrelic-app-data";

/**
 * @brief Account id out of a "<account>#<application>" cross-process id
 *
 * Both halves must be non-empty decimal digits; anything else (no '#',
 * signs, trailing junk, overflow) yields nullopt so the caller treats the
 * payload as untrusted.
 */
[[nodiscard]] std::optional<int64_t> parse_account_id(std::string_view cross_process_id);

/**
 * @brief Trust check for a remote cross-process id
 * @return The trusted account id, or UNTRUSTED_DATA when there is no trust
 *         list, the id is malformed, or its account is not listed
 */
[[nodiscard]] Result<int64_t> check_trust(const ServerSettings& settings,
                                          std::string_view cross_process_id);

/// True when `cross_process_id` names an account on the trust list
[[nodiscard]] bool is_trusted(const ServerSettings& settings, std::string_view cross_process_id);

/**
 * @brief Deobfuscate and parse an obfuscated JSON header value
 * @return The parsed document, or DECODE_ERROR
 */
[[nodiscard]] Result<nlohmann::json> decode_header_json(std::string_view obfuscated,
                                                         std::string_view encoding_key);

/**
 * @brief Add x-newrelic-id and x-newrelic-transaction for an outbound call
 *
 * Computes the path hash for the transaction's current name, records it in
 * the transaction's outbound path history and writes the obfuscated
 * [id, false, trip id, path hash] payload. Does nothing without an encoding
 * key.
 *
 * @return true when the transaction header was added
 */
bool add_cat_headers(const ServerSettings& settings,
                     std::string_view app_name,
                     Transaction& transaction,
                     OutboundHeaders& headers);

/**
 * @brief Apply a downstream service's x-newrelic-app-data to an external segment
 *
 * Requires an encoding key and a trust list. A trusted payload links the
 * segment to the remote transaction and renames it
 * "ExternalTransaction/<host>/<cat id>/<cat transaction>". Untrusted or
 * unparsable payloads are logged and discarded.
 *
 * @return true when the segment was linked
 */
bool pull_cat_headers(const ServerSettings& settings,
                      Segment& segment,
                      std::string_view host,
                      const std::string* obfuscated_app_data);

/**
 * @brief Continue an upstream caller's CAT trip on an inbound request
 *
 * Reads x-newrelic-id (trust check), x-newrelic-transaction (trip id and
 * referring path hash) and x-newrelic-synthetics.
 *
 * @return true when the transaction header was accepted
 */
bool accept_cat_request_headers(const ServerSettings& settings,
                                Transaction& transaction,
                                const HeaderMap& headers);

} // namespace cat
} // namespace apmcore
