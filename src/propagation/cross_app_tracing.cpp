#include "propagation/cross_app_tracing.hpp"
#include "propagation/hashes.hpp"
#include "propagation/outbound_headers.hpp"
#include "metrics/metric_names.hpp"
#include "tracing/segment.hpp"
#include "tracing/transaction.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace apmcore::cat {

namespace {

constexpr int64_t kSyntheticsVersion = 1;
constexpr size_t kSyntheticsFields = 5;

AttributeValue json_to_attribute(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) return value.get<double>();
    return value.dump();
}

bool account_trusted(const ServerSettings& settings, int64_t account_id) {
    const auto& trusted = *settings.trusted_account_ids;
    return std::find(trusted.begin(), trusted.end(), account_id) != trusted.end();
}

// Synthetics payload: [version, account id, resource id, job id, monitor id]
bool valid_synthetics(const ServerSettings& settings, const std::string& header) {
    auto decoded = decode_header_json(header, *settings.encoding_key);
    if (decoded.is_error()) {
        utils::log::debug(std::format("Ignoring synthetics header: {}", decoded.error_message()));
        return false;
    }

    const auto& data = decoded.value();
    if (!data.is_array() || data.size() < kSyntheticsFields) return false;
    if (!data[0].is_number_integer() || data[0].get<int64_t>() != kSyntheticsVersion) return false;
    if (!data[1].is_number_integer()) return false;
    return account_trusted(settings, data[1].get<int64_t>());
}

} // anonymous namespace

std::optional<int64_t> parse_account_id(std::string_view cross_process_id) {
    const auto hash = cross_process_id.find('#');
    if (hash == std::string_view::npos) return std::nullopt;

    const auto account = cross_process_id.substr(0, hash);
    const auto application = cross_process_id.substr(hash + 1);
    if (!utils::parse_int_strict<int64_t>(application)) return std::nullopt;
    return utils::parse_int_strict<int64_t>(account);
}

Result<int64_t> check_trust(const ServerSettings& settings, std::string_view cross_process_id) {
    if (!settings.trusted_account_ids) {
        return Result<int64_t>::error(ErrorCategory::UNTRUSTED_DATA, "no trusted account ids configured");
    }
    const auto account_id = parse_account_id(cross_process_id);
    if (!account_id) {
        return Result<int64_t>::error(ErrorCategory::UNTRUSTED_DATA,
                                      std::format("malformed cross process id '{}'", cross_process_id));
    }
    if (!account_trusted(settings, *account_id)) {
        return Result<int64_t>::error(ErrorCategory::UNTRUSTED_DATA,
                                      std::format("account {} is not trusted", *account_id));
    }
    return Result<int64_t>::ok(*account_id);
}

bool is_trusted(const ServerSettings& settings, std::string_view cross_process_id) {
    return check_trust(settings, cross_process_id).is_ok();
}

Result<nlohmann::json> decode_header_json(std::string_view obfuscated, std::string_view encoding_key) {
    auto plain = hashes::deobfuscate_name_using_key(obfuscated, encoding_key);
    if (plain.is_error()) {
        return Result<nlohmann::json>::error(plain.error_category(), plain.error_message());
    }

    auto parsed = nlohmann::json::parse(plain.value(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Result<nlohmann::json>::error(ErrorCategory::DECODE_ERROR,
                                             "deobfuscated header is not valid JSON");
    }
    return Result<nlohmann::json>::ok(std::move(parsed));
}

// ============================================================================
// Outbound
// ============================================================================

bool add_cat_headers(const ServerSettings& settings,
                     std::string_view app_name,
                     Transaction& transaction,
                     OutboundHeaders& headers) {
    if (!settings.encoding_key) {
        utils::log::trace("No encoding key found, not adding CAT headers");
        return false;
    }

    if (settings.obfuscated_id) {
        headers.set(std::string(kIdHeader), *settings.obfuscated_id);
    }

    const auto referring = transaction.referring_path_hash();
    auto path_hash = hashes::calculate_path_hash(
        app_name, transaction.full_name(),
        referring ? std::optional<std::string_view>(*referring) : std::nullopt);
    transaction.push_path_hash(path_hash);

    try {
        const nlohmann::json payload = nlohmann::json::array(
            {transaction.id(), false, transaction.trip_id(), path_hash});
        headers.set(std::string(kTransactionHeader),
                    hashes::obfuscate_name_using_key(payload.dump(), *settings.encoding_key));
    } catch (const nlohmann::json::exception& e) {
        utils::log::trace(std::format("Failed to create CAT payload: {}", e.what()));
        return false;
    }

    utils::log::trace(std::format("Added outbound request CAT headers in transaction {}",
                                  transaction.id()));
    return true;
}

// ============================================================================
// Inbound
// ============================================================================

bool pull_cat_headers(const ServerSettings& settings,
                      Segment& segment,
                      std::string_view host,
                      const std::string* obfuscated_app_data) {
    if (!settings.encoding_key) {
        utils::log::trace("encoding_key is not set - not parsing response CAT headers");
        return false;
    }
    if (!settings.trusted_account_ids) {
        utils::log::trace("trusted_account_ids is not set - not parsing response CAT headers");
        return false;
    }
    if (!obfuscated_app_data) {
        utils::log::trace(std::format("Got no CAT app data in response header {}", kAppDataHeader));
        return false;
    }

    auto decoded = decode_header_json(*obfuscated_app_data, *settings.encoding_key);
    if (decoded.is_error()) {
        utils::log::warn(std::format("Got an unparsable CAT header {}: {}",
                                     kAppDataHeader, *obfuscated_app_data));
        return false;
    }

    const auto& app_data = decoded.value();
    if (!app_data.is_array() || app_data.size() < 2 ||
        !app_data[0].is_string() || !app_data[1].is_string()) {
        utils::log::debug(std::format("Ignoring malformed CAT app data: {}", app_data.dump()));
        return false;
    }

    const auto cat_id = app_data[0].get<std::string>();
    if (const auto trust = check_trust(settings, cat_id); trust.is_error()) {
        utils::log::trace(std::format("Ignoring response CAT header: {}", trust.error_message()));
        return false;
    }

    auto cat_transaction = app_data[1].get<std::string>();
    segment.set_name(std::format("{}{}/{}/{}", metric_names::kExternalTransactionPrefix,
                                 host, cat_id, cat_transaction));
    segment.set_cat_link(cat_id, std::move(cat_transaction));
    if (app_data.size() >= 6) {
        segment.add_attribute("transaction_guid", json_to_attribute(app_data[5]));
    }

    if (const auto tx = segment.transaction()) {
        utils::log::trace(std::format("Got inbound response CAT headers in transaction {}", tx->id()));
    }
    return true;
}

bool accept_cat_request_headers(const ServerSettings& settings,
                                Transaction& transaction,
                                const HeaderMap& headers) {
    if (!settings.encoding_key || !settings.trusted_account_ids) return false;
    const auto& key = *settings.encoding_key;

    const auto* obfuscated_id = find_header(headers, kIdHeader);
    if (!obfuscated_id) return false;

    auto caller_id = hashes::deobfuscate_name_using_key(*obfuscated_id, key);
    if (caller_id.is_error()) {
        utils::log::trace(std::format("Ignoring CAT request headers, caller id {} is unparsable",
                                      *obfuscated_id));
        return false;
    }
    if (const auto trust = check_trust(settings, caller_id.value()); trust.is_error()) {
        utils::log::trace(std::format("Ignoring CAT request headers: {}", trust.error_message()));
        return false;
    }

    if (const auto* synthetics = find_header(headers, kSyntheticsHeader)) {
        if (valid_synthetics(settings, *synthetics)) {
            transaction.set_synthetics_header(*synthetics);
        }
    }

    const auto* tx_header = find_header(headers, kTransactionHeader);
    if (!tx_header) return false;

    auto decoded = decode_header_json(*tx_header, key);
    if (decoded.is_error()) {
        utils::log::warn(std::format("Got an unparsable CAT header {}: {}",
                                     kTransactionHeader, *tx_header));
        return false;
    }

    // [referring guid, unused, trip id, referring path hash]
    const auto& data = decoded.value();
    if (!data.is_array() || data.size() < 4) return false;

    if (data[2].is_string()) transaction.set_trip_id(data[2].get<std::string>());
    if (data[3].is_string()) transaction.set_referring_path_hash(data[3].get<std::string>());
    return true;
}

} // namespace apmcore::cat
