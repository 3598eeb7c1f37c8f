#include <catch2/catch_test_macros.hpp>
#include "propagation/outbound_headers.hpp"

using namespace apmcore;

// ============================================================================
// OutboundHeaders
// ============================================================================

TEST_CASE("OutboundHeaders: set keeps insertion order and replaces in place", "[headers]") {
    OutboundHeaders headers;
    REQUIRE(headers.empty());

    headers.set("x-newrelic-id", "abc");
    headers.set("x-newrelic-transaction", "def");
    headers.set("x-newrelic-id", "xyz");

    REQUIRE(headers.size() == 2);
    REQUIRE(headers.entries()[0].first == "x-newrelic-id");
    REQUIRE(headers.entries()[0].second == "xyz");
    REQUIRE(headers.entries()[1].first == "x-newrelic-transaction");
    REQUIRE(headers.contains("x-newrelic-transaction"));
    REQUIRE(headers.find("missing") == nullptr);
}

TEST_CASE("OutboundHeaders: merge into a header list appends", "[headers]") {
    OutboundHeaders headers;
    headers.set("traceparent", "00-aa-bb-01");

    const HeaderCarrier original = HeaderList{{"Accept", "*/*"}, {"Cookie", "a=1"}, {"Cookie", "b=2"}};
    const auto merged = headers.merge_into(original);

    REQUIRE(std::holds_alternative<HeaderList>(merged));
    const auto& list = std::get<HeaderList>(merged);
    REQUIRE(list.size() == 4);
    REQUIRE(list[0].first == "Accept");
    REQUIRE(list[2].second == "b=2");
    REQUIRE(list[3].first == "traceparent");
    REQUIRE(list[3].second == "00-aa-bb-01");

    // Caller's container is untouched
    REQUIRE(std::get<HeaderList>(original).size() == 3);
}

TEST_CASE("OutboundHeaders: merge into a header map assigns", "[headers]") {
    OutboundHeaders headers;
    headers.set("x-newrelic-id", "ours");
    headers.set("x-newrelic-transaction", "payload");

    const HeaderCarrier original = HeaderMap{{"x-newrelic-id", "theirs"}, {"Accept", "*/*"}};
    const auto merged = headers.merge_into(original);

    REQUIRE(std::holds_alternative<HeaderMap>(merged));
    const auto& map = std::get<HeaderMap>(merged);
    REQUIRE(map.size() == 3);
    REQUIRE(map.at("x-newrelic-id") == "ours");
    REQUIRE(map.at("x-newrelic-transaction") == "payload");
    REQUIRE(map.at("Accept") == "*/*");

    REQUIRE(std::get<HeaderMap>(original).at("x-newrelic-id") == "theirs");
    REQUIRE(std::get<HeaderMap>(original).size() == 2);
}

TEST_CASE("OutboundHeaders: empty set returns an equal copy", "[headers]") {
    OutboundHeaders headers;
    const HeaderCarrier original = HeaderMap{{"Accept", "*/*"}};
    REQUIRE(headers.merge_into(original) == original);
}

// ============================================================================
// find_header
// ============================================================================

TEST_CASE("OutboundHeaders: find_header is case-insensitive in both shapes", "[headers]") {
    SECTION("Map") {
        const HeaderMap map{{"X-NewRelic-App-Data", "data"}};
        REQUIRE(find_header(map, "x-newrelic-app-data") != nullptr);
        REQUIRE(*find_header(map, "x-newrelic-app-data") == "data");
        REQUIRE(find_header(map, "x-newrelic-id") == nullptr);

        const HeaderCarrier carrier = map;
        REQUIRE(*find_header(carrier, "X-NEWRELIC-APP-DATA") == "data");
    }

    SECTION("List returns the first match") {
        const HeaderCarrier carrier = HeaderList{{"Set-Cookie", "a"}, {"set-cookie", "b"}};
        REQUIRE(*find_header(carrier, "set-cookie") == "a");
        REQUIRE(find_header(carrier, "cookie") == nullptr);
    }
}
