#include <catch2/catch_test_macros.hpp>
#include "propagation/cross_app_tracing.hpp"
#include "propagation/hashes.hpp"
#include "propagation/outbound_headers.hpp"
#include "tracing/segment.hpp"
#include "tracing/transaction.hpp"

using namespace apmcore;

namespace {

constexpr const char* kKey = "ThisIsAKey";

// ["190#1","WebTransaction/foo",0,1.5,-1,"guid123"]
constexpr const char* kTrustedAppData =
    "D0pYSnlQcGlJWwMNCyc7Ei84BBogAQYdZhUuJEdVZERYXXxfbHpJWzMdABd4QXJpOA==";
// Same payload from account 999
constexpr const char* kUntrustedAppData =
    "D0pQSnBQcGlJWwMNCyc7Ei84BBogAQYdZhUuJEdVZERYXXxfbHpJWzMdABd4QXJpOA==";

// "190#1"
constexpr const char* kTrustedCallerId = "ZVFZUHg=";
// ["guid0",false,"trip1","0bf6630e"]
constexpr const char* kCallerTransaction = "D0oOBiAXcWlJHzUEGhZlUTU5DAllSkVReREnfVNKZA1LLg==";
// [1,190,"res","job","mon"] and [1,999,"res","job","mon"]
constexpr const char* kTrustedSynthetics = "D1lFQnBDbWkXHCdKRVEjHCNpSVs5BwdRFA==";
constexpr const char* kUntrustedSynthetics = "D1lFSnBKbWkXHCdKRVEjHCNpSVs5BwdRFA==";

ServerSettings make_settings() {
    ServerSettings settings;
    settings.encoding_key = kKey;
    settings.trusted_account_ids = std::vector<int64_t>{190};
    settings.cross_process_id = "190#1";
    settings.obfuscated_id = hashes::obfuscate_name_using_key("190#1", kKey);
    return settings;
}

} // anonymous namespace

// ============================================================================
// Account ids
// ============================================================================

TEST_CASE("CrossAppTracing: account id parsing fails closed", "[cat]") {
    REQUIRE(cat::parse_account_id("190#1") == 190);
    REQUIRE(cat::parse_account_id("1#2") == 1);

    REQUIRE_FALSE(cat::parse_account_id("190").has_value());
    REQUIRE_FALSE(cat::parse_account_id("#1").has_value());
    REQUIRE_FALSE(cat::parse_account_id("190#").has_value());
    REQUIRE_FALSE(cat::parse_account_id("-190#1").has_value());
    REQUIRE_FALSE(cat::parse_account_id("190x#1").has_value());
    REQUIRE_FALSE(cat::parse_account_id("190#1#2").has_value());
    REQUIRE_FALSE(cat::parse_account_id("99999999999999999999#1").has_value());
}

TEST_CASE("CrossAppTracing: trust list lookup", "[cat]") {
    auto settings = make_settings();
    REQUIRE(cat::is_trusted(settings, "190#1"));
    REQUIRE(cat::is_trusted(settings, "190#77"));
    REQUIRE_FALSE(cat::is_trusted(settings, "999#1"));
    REQUIRE_FALSE(cat::is_trusted(settings, "garbage"));

    settings.trusted_account_ids.reset();
    REQUIRE_FALSE(cat::is_trusted(settings, "190#1"));
}

TEST_CASE("CrossAppTracing: check_trust reports untrusted data", "[cat]") {
    auto settings = make_settings();

    SECTION("Trusted account") {
        const auto trust = cat::check_trust(settings, "190#1");
        REQUIRE(trust.is_ok());
        REQUIRE(trust.value() == 190);
    }

    SECTION("Unlisted account") {
        const auto trust = cat::check_trust(settings, "999#1");
        REQUIRE(trust.is_error());
        REQUIRE(trust.error_category() == ErrorCategory::UNTRUSTED_DATA);
    }

    SECTION("Malformed id") {
        const auto trust = cat::check_trust(settings, "190");
        REQUIRE(trust.error_category() == ErrorCategory::UNTRUSTED_DATA);
    }

    SECTION("No trust list") {
        settings.trusted_account_ids.reset();
        const auto trust = cat::check_trust(settings, "190#1");
        REQUIRE(trust.error_category() == ErrorCategory::UNTRUSTED_DATA);
    }
}

TEST_CASE("CrossAppTracing: decode_header_json", "[cat]") {
    SECTION("Valid payload") {
        const auto decoded = cat::decode_header_json(kTrustedAppData, kKey);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().is_array());
        REQUIRE(decoded.value().size() == 6);
        REQUIRE(decoded.value()[0] == "190#1");
    }

    SECTION("Base64 of something that is not JSON") {
        const auto decoded = cat::decode_header_json(
            hashes::obfuscate_name_using_key("not json", kKey), kKey);
        REQUIRE(decoded.is_error());
        REQUIRE(decoded.error_category() == ErrorCategory::DECODE_ERROR);
    }

    SECTION("Not base64 at all") {
        REQUIRE(cat::decode_header_json("%%%", kKey).is_error());
    }
}

// ============================================================================
// Outbound
// ============================================================================

TEST_CASE("CrossAppTracing: add_cat_headers writes id and transaction payload", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);
    tx->set_name("test");

    OutboundHeaders headers;
    REQUIRE(cat::add_cat_headers(settings, "test app", *tx, headers));

    REQUIRE(headers.find("x-newrelic-id") != nullptr);
    REQUIRE(*headers.find("x-newrelic-id") == "ZVFZUHg=");

    const auto* tx_header = headers.find("x-newrelic-transaction");
    REQUIRE(tx_header != nullptr);

    const auto payload = cat::decode_header_json(*tx_header, kKey);
    REQUIRE(payload.is_ok());
    const auto expected = nlohmann::json::array({tx->id(), false, tx->trip_id(), "2f9ecffe"});
    REQUIRE(payload.value() == expected);

    REQUIRE(tx->path_hashes() == std::vector<std::string>{"2f9ecffe"});
    REQUIRE(tx->includes_outbound_path("2f9ecffe"));
}

TEST_CASE("CrossAppTracing: add_cat_headers chains the referring path hash", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);
    tx->set_name("test");
    tx->set_referring_path_hash("12345678");

    OutboundHeaders headers;
    REQUIRE(cat::add_cat_headers(settings, "test app", *tx, headers));
    REQUIRE(tx->path_hashes() == std::vector<std::string>{"0bf6630e"});
}

TEST_CASE("CrossAppTracing: add_cat_headers needs an encoding key", "[cat]") {
    auto settings = make_settings();
    settings.encoding_key.reset();
    auto tx = Transaction::create(TransactionType::WEB);

    OutboundHeaders headers;
    REQUIRE_FALSE(cat::add_cat_headers(settings, "test app", *tx, headers));
    REQUIRE(headers.empty());
    REQUIRE(tx->path_hashes().empty());
}

TEST_CASE("CrossAppTracing: missing obfuscated id only skips x-newrelic-id", "[cat]") {
    auto settings = make_settings();
    settings.obfuscated_id.reset();
    auto tx = Transaction::create(TransactionType::WEB);

    OutboundHeaders headers;
    REQUIRE(cat::add_cat_headers(settings, "test app", *tx, headers));
    REQUIRE_FALSE(headers.contains("x-newrelic-id"));
    REQUIRE(headers.contains("x-newrelic-transaction"));
}

// ============================================================================
// Response app data
// ============================================================================

TEST_CASE("CrossAppTracing: trusted app data links and renames the segment", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);
    auto segment = tx->root_segment()->add_child("External/example.com/foo");

    const std::string app_data = kTrustedAppData;
    REQUIRE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));

    REQUIRE(segment->name() == "ExternalTransaction/example.com/190#1/WebTransaction/foo");
    REQUIRE(segment->cat_id() == "190#1");
    REQUIRE(segment->cat_transaction() == "WebTransaction/foo");

    const auto attrs = segment->attributes();
    REQUIRE(attrs.count("transaction_guid") == 1);
    REQUIRE(std::get<std::string>(attrs.at("transaction_guid")) == "guid123");
}

TEST_CASE("CrossAppTracing: untrusted or unusable app data is ignored", "[cat]") {
    auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);
    auto segment = tx->root_segment()->add_child("External/example.com/foo");
    const std::string original = segment->name();

    SECTION("Untrusted account") {
        const std::string app_data = kUntrustedAppData;
        REQUIRE_FALSE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));
    }

    SECTION("Garbage payload") {
        const std::string app_data = "%%%not-base64";
        REQUIRE_FALSE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));
    }

    SECTION("Too few elements") {
        const std::string app_data = hashes::obfuscate_name_using_key(R"(["190#1"])", kKey);
        REQUIRE_FALSE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));
    }

    SECTION("No header") {
        REQUIRE_FALSE(cat::pull_cat_headers(settings, *segment, "example.com", nullptr));
    }

    SECTION("No encoding key") {
        settings.encoding_key.reset();
        const std::string app_data = kTrustedAppData;
        REQUIRE_FALSE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));
    }

    SECTION("No trust list") {
        settings.trusted_account_ids.reset();
        const std::string app_data = kTrustedAppData;
        REQUIRE_FALSE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));
    }

    REQUIRE(segment->name() == original);
    REQUIRE(segment->cat_id().empty());
    REQUIRE(segment->attributes().empty());
}

TEST_CASE("CrossAppTracing: short trusted app data links without a guid", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);
    auto segment = tx->root_segment()->add_child("External/example.com/foo");

    const std::string app_data =
        hashes::obfuscate_name_using_key(R"(["190#1","WebTransaction/bar"])", kKey);
    REQUIRE(cat::pull_cat_headers(settings, *segment, "example.com", &app_data));
    REQUIRE(segment->name() == "ExternalTransaction/example.com/190#1/WebTransaction/bar");
    REQUIRE(segment->attributes().count("transaction_guid") == 0);
}

// ============================================================================
// Inbound request headers
// ============================================================================

TEST_CASE("CrossAppTracing: trusted caller continues the trip", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);

    HeaderMap headers{
        {"X-NewRelic-ID", kTrustedCallerId},
        {"X-NewRelic-Transaction", kCallerTransaction},
        {"X-NewRelic-Synthetics", kTrustedSynthetics},
    };
    REQUIRE(cat::accept_cat_request_headers(settings, *tx, headers));

    REQUIRE(tx->trip_id() == "trip1");
    REQUIRE(tx->referring_path_hash() == std::optional<std::string>("0bf6630e"));
    REQUIRE(tx->synthetics_header() == kTrustedSynthetics);
}

TEST_CASE("CrossAppTracing: untrusted synthetics header is dropped", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);

    HeaderMap headers{
        {"x-newrelic-id", kTrustedCallerId},
        {"x-newrelic-transaction", kCallerTransaction},
        {"x-newrelic-synthetics", kUntrustedSynthetics},
    };
    REQUIRE(cat::accept_cat_request_headers(settings, *tx, headers));
    REQUIRE(tx->synthetics_header().empty());
}

TEST_CASE("CrossAppTracing: untrusted caller is ignored", "[cat]") {
    const auto settings = make_settings();
    auto tx = Transaction::create(TransactionType::WEB);
    const auto trip = tx->trip_id();

    HeaderMap headers{
        {"x-newrelic-id", hashes::obfuscate_name_using_key("999#1", kKey)},
        {"x-newrelic-transaction", kCallerTransaction},
    };
    REQUIRE_FALSE(cat::accept_cat_request_headers(settings, *tx, headers));
    REQUIRE(tx->trip_id() == trip);
    REQUIRE_FALSE(tx->referring_path_hash().has_value());
}
