#include <catch2/catch_test_macros.hpp>
#include "agent/agent.hpp"
#include "instrumentation/http_outbound.hpp"
#include "propagation/outbound_headers.hpp"

#include <optional>

using namespace apmcore;
using json = nlohmann::json;

namespace {

constexpr const char* kKey = "ThisIsAKey";
// ["190#1","WebTransaction/foo",0,1.5,-1,"guid123"]
constexpr const char* kTrustedAppData =
    "D0pYSnlQcGlJWwMNCyc7Ei84BBogAQYdZhUuJEdVZERYXXxfbHpJWzMdABd4QXJpOA==";

AgentConfig make_config(bool distributed_tracing, bool cat) {
    AgentConfig config;
    config.app_names = {"test app"};
    config.distributed_tracing_enabled = distributed_tracing;
    config.cross_application_tracer_enabled = cat;
    config.server_settings = json{
        {"encoding_key", kKey},
        {"cross_process_id", "190#1"},
        {"trusted_account_ids", json::array({190})},
    };
    return config;
}

// Stands in for the transport: remembers what it was asked to send
struct FakeTransport {
    std::optional<RequestOptions> sent;
    int calls = 0;

    MakeRequest make_request() {
        return [this](const RequestOptions& options) {
            ++calls;
            sent = options;
            return std::make_shared<ClientRequest>(options.path, options.headers);
        };
    }
};

RequestOptions options_for(std::string hostname, int port, std::string path) {
    RequestOptions options;
    options.hostname = std::move(hostname);
    options.port = port;
    options.path = std::move(path);
    options.headers = HeaderMap{{"Accept", "*/*"}};
    return options;
}

} // anonymous namespace

// ============================================================================
// Segment creation
// ============================================================================

TEST_CASE("HttpOutbound: request becomes an External segment", "[http]") {
    Agent agent(make_config(true, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 8080, "/users/?id=7"),
                                      transport.make_request());
    });

    REQUIRE(transport.calls == 1);
    REQUIRE(request != nullptr);

    const auto segment = request->segment();
    REQUIRE(segment != nullptr);
    REQUIRE(segment->name() == "External/example.com:8080/users");
    REQUIRE(tx->root_segment()->children().size() == 1);
    REQUIRE(tx->root_segment()->children()[0] == segment);

    const auto attrs = segment->attributes();
    REQUIRE(std::get<std::string>(attrs.at("url")) == "http://example.com:8080/users");
    REQUIRE(std::get<std::string>(attrs.at("procedure")) == "GET");
    REQUIRE(std::get<std::string>(segment->span_attributes().at("request.parameters.id")) == "7");
}

TEST_CASE("HttpOutbound: default ports", "[http]") {
    Agent agent(make_config(false, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    SECTION("Port 80 is not part of the name") {
        std::shared_ptr<ClientRequest> request;
        agent.tracer().run_in_segment(tx->root_segment(), [&] {
            request = instrument_outbound(agent, options_for("example.com", 80, "/"),
                                          transport.make_request());
        });
        REQUIRE(request->segment()->name() == "External/example.com/");
    }

    SECTION("https defaults to 443") {
        auto options = options_for("example.com", 0, "/a");
        options.protocol = "https:";
        std::shared_ptr<ClientRequest> request;
        agent.tracer().run_in_segment(tx->root_segment(), [&] {
            request = instrument_outbound(agent, std::move(options), transport.make_request());
        });
        REQUIRE(request->segment()->name() == "External/example.com:443/a");
        REQUIRE(std::get<std::string>(request->segment()->attributes().at("url")) ==
                "https://example.com:443/a");
    }

    SECTION("host is used when hostname is empty") {
        auto options = options_for("", 0, "/b");
        options.host = "fallback.local";
        std::shared_ptr<ClientRequest> request;
        agent.tracer().run_in_segment(tx->root_segment(), [&] {
            request = instrument_outbound(agent, std::move(options), transport.make_request());
        });
        REQUIRE(request->segment()->name() == "External/fallback.local/b");
    }
}

// ============================================================================
// Unobserved requests
// ============================================================================

TEST_CASE("HttpOutbound: requests outside a transaction are not observed", "[http]") {
    Agent agent(make_config(true, false));
    FakeTransport transport;

    auto request = instrument_outbound(agent, options_for("example.com", 80, "/"),
                                       transport.make_request());

    REQUIRE(transport.calls == 1);
    REQUIRE(request->segment() == nullptr);
    REQUIRE(find_header(transport.sent->headers, "traceparent") == nullptr);
}

TEST_CASE("HttpOutbound: opaque parent skips instrumentation", "[http]") {
    Agent agent(make_config(true, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");
    auto db = tx->root_segment()->add_child("Datastore/operation/MongoDB/find");
    db->set_opaque(true);

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(db, [&] {
        request = instrument_outbound(agent, options_for("db.internal", 27017, "/"),
                                      transport.make_request());
    });

    REQUIRE(transport.calls == 1);
    REQUIRE(request->segment() == nullptr);
    REQUIRE(db->children().empty());
    REQUIRE(find_header(transport.sent->headers, "traceparent") == nullptr);
}

TEST_CASE("HttpOutbound: invalid port makes the request unobserved", "[http]") {
    Agent agent(make_config(true, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", -1, "/"),
                                      transport.make_request());
    });

    REQUIRE(transport.calls == 1);
    REQUIRE(request->segment() == nullptr);
    REQUIRE(tx->root_segment()->children().empty());
}

TEST_CASE("HttpOutbound: transport returning no request ends the segment", "[http]") {
    Agent agent(make_config(false, false));
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 80, "/"),
                                      [](const RequestOptions&) { return nullptr; });
    });

    REQUIRE(request == nullptr);
    REQUIRE(tx->root_segment()->children().size() == 1);
    REQUIRE(tx->root_segment()->children()[0]->is_ended());
}

// ============================================================================
// Propagation headers
// ============================================================================

TEST_CASE("HttpOutbound: distributed tracing headers", "[http]") {
    Agent agent(make_config(true, true));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    const HeaderMap caller_headers{{"Accept", "*/*"}};
    auto options = options_for("example.com", 80, "/");
    options.headers = caller_headers;

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options, transport.make_request());
    });

    const auto& sent = transport.sent->headers;
    REQUIRE(std::holds_alternative<HeaderMap>(sent));
    const auto* traceparent = find_header(sent, "traceparent");
    REQUIRE(traceparent != nullptr);
    REQUIRE(*traceparent == "00-" + tx->trace_context().trace_id + "-" + request->segment()->id() + "-01");
    REQUIRE(find_header(sent, "x-newrelic-transaction") == nullptr);
    REQUIRE(*find_header(sent, "Accept") == "*/*");

    // The caller's own options are untouched
    REQUIRE(std::get<HeaderMap>(options.headers) == caller_headers);
    REQUIRE(tx->header_mode() == TraceHeaderMode::DISTRIBUTED_TRACING);
}

TEST_CASE("HttpOutbound: instrumentation can opt out of traceparent", "[http]") {
    Agent agent(make_config(true, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    auto options = options_for("collector.local", 443, "/agent_listener");
    options.disable_distributed_tracing = true;

    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        (void)instrument_outbound(agent, std::move(options), transport.make_request());
    });

    REQUIRE(find_header(transport.sent->headers, "traceparent") == nullptr);
}

TEST_CASE("HttpOutbound: CAT headers appended to a header list", "[http]") {
    Agent agent(make_config(false, true));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    auto options = options_for("example.com", 80, "/");
    options.headers = HeaderList{{"Cookie", "a=1"}};

    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        (void)instrument_outbound(agent, std::move(options), transport.make_request());
    });

    const auto& sent = transport.sent->headers;
    REQUIRE(std::holds_alternative<HeaderList>(sent));
    const auto& list = std::get<HeaderList>(sent);
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].first == "Cookie");
    REQUIRE(list[1].first == "x-newrelic-id");
    REQUIRE(list[1].second == "ZVFZUHg=");
    REQUIRE(list[2].first == "x-newrelic-transaction");

    REQUIRE(find_header(sent, "traceparent") == nullptr);
    REQUIRE(tx->path_hashes() == std::vector<std::string>{"2f9ecffe"});
    REQUIRE(tx->header_mode() == TraceHeaderMode::CROSS_APPLICATION);
}

TEST_CASE("HttpOutbound: no propagation when both protocols are off", "[http]") {
    Agent agent(make_config(false, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        (void)instrument_outbound(agent, options_for("example.com", 80, "/"), transport.make_request());
    });

    REQUIRE(std::get<HeaderMap>(transport.sent->headers).size() == 1);
}

// ============================================================================
// Response lifecycle
// ============================================================================

TEST_CASE("HttpOutbound: segment ends when the response body ends", "[http]") {
    Agent agent(make_config(false, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 80, "/items"),
                                      transport.make_request());
    });
    const auto segment = request->segment();

    std::shared_ptr<Segment> seen_in_listener;
    request->on(HttpEventType::RESPONSE, [&](const HttpEvent&) {
        seen_in_listener = agent.tracer().get_segment();
    });

    auto response = std::make_shared<IncomingResponse>(201, "Created");
    REQUIRE(request->emit(HttpEvent{HttpEventType::RESPONSE, response, ""}));
    REQUIRE(seen_in_listener == segment);
    REQUIRE_FALSE(segment->is_ended());

    const auto span = segment->span_attributes();
    REQUIRE(std::get<int64_t>(span.at("http.statusCode")) == 201);
    REQUIRE(std::get<std::string>(span.at("http.statusText")) == "Created");

    response->emit(HttpEvent{HttpEventType::DATA, nullptr, "chunk"});
    REQUIRE_FALSE(segment->is_ended());
    response->emit(HttpEvent{HttpEventType::END, nullptr, ""});
    REQUIRE(segment->is_ended());
}

TEST_CASE("HttpOutbound: request errors", "[http]") {
    Agent agent(make_config(false, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 80, "/"),
                                      transport.make_request());
    });

    SECTION("Unhandled errors are recorded on the transaction") {
        REQUIRE_FALSE(request->emit(HttpEvent{HttpEventType::ERROR, nullptr, "ECONNRESET"}));
        REQUIRE(request->segment()->is_ended());
        REQUIRE(tx->errors() == std::vector<std::string>{"ECONNRESET"});
    }

    SECTION("Errors the caller listens for are left to the caller") {
        std::string handled;
        request->on(HttpEventType::ERROR, [&](const HttpEvent& event) { handled = event.payload; });

        REQUIRE(request->emit(HttpEvent{HttpEventType::ERROR, nullptr, "ECONNRESET"}));
        REQUIRE(handled == "ECONNRESET");
        REQUIRE(request->segment()->is_ended());
        REQUIRE(tx->errors().empty());
    }
}

TEST_CASE("HttpOutbound: CAT app data renames the segment", "[http]") {
    Agent agent(make_config(false, true));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 80, "/foo"),
                                      transport.make_request());
    });

    auto response = std::make_shared<IncomingResponse>(
        200, "OK", HeaderMap{{"X-NewRelic-App-Data", kTrustedAppData}});
    request->emit(HttpEvent{HttpEventType::RESPONSE, response, ""});

    const auto segment = request->segment();
    REQUIRE(segment->name() == "ExternalTransaction/example.com/190#1/WebTransaction/foo");
    REQUIRE(segment->cat_id() == "190#1");
}

TEST_CASE("HttpOutbound: app data is ignored under distributed tracing", "[http]") {
    Agent agent(make_config(true, true));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 80, "/foo"),
                                      transport.make_request());
    });

    auto response = std::make_shared<IncomingResponse>(
        200, "OK", HeaderMap{{"x-newrelic-app-data", kTrustedAppData}});
    request->emit(HttpEvent{HttpEventType::RESPONSE, response, ""});

    REQUIRE(request->segment()->name() == "External/example.com/foo");
}

TEST_CASE("HttpOutbound: external metrics are recorded at transaction end", "[http]") {
    Agent agent(make_config(false, false));
    FakeTransport transport;
    auto tx = agent.start_transaction(TransactionType::WEB, "test");

    std::shared_ptr<ClientRequest> request;
    agent.tracer().run_in_segment(tx->root_segment(), [&] {
        request = instrument_outbound(agent, options_for("example.com", 8080, "/"),
                                      transport.make_request());
    });
    auto response = std::make_shared<IncomingResponse>(200, "OK");
    request->emit(HttpEvent{HttpEventType::RESPONSE, response, ""});
    response->emit(HttpEvent{HttpEventType::END, nullptr, ""});
    tx->end();

    const auto& metrics = agent.metrics();
    for (const char* name : {"External/example.com:8080/http", "External/example.com:8080/all",
                             "External/all", "External/allWeb", "WebTransaction/test"}) {
        INFO(name);
        const auto stats = metrics.get_unscoped(name);
        REQUIRE(stats.has_value());
        REQUIRE(stats->call_count == 1);
    }
    REQUIRE_FALSE(metrics.get_unscoped("External/allOther").has_value());

    const auto scoped = metrics.get_scoped("WebTransaction/test", "External/example.com:8080/http");
    REQUIRE(scoped.has_value());
    REQUIRE(scoped->call_count == 1);
}

// ============================================================================
// RequestOptions::from_url
// ============================================================================

TEST_CASE("HttpOutbound: options from a URL", "[http]") {
    SECTION("Full URL") {
        const auto options = RequestOptions::from_url("https://user@api.example.com:8443/v1/items?x=1");
        REQUIRE(options.protocol == "https:");
        REQUIRE(options.hostname == "api.example.com");
        REQUIRE(options.port == 8443);
        REQUIRE(options.path == "/v1/items?x=1");
    }

    SECTION("No path") {
        const auto options = RequestOptions::from_url("http://example.com");
        REQUIRE(options.hostname == "example.com");
        REQUIRE(options.port == 0);
        REQUIRE(options.path == "/");
    }

    SECTION("Query without a path") {
        const auto options = RequestOptions::from_url("http://example.com?q=1");
        REQUIRE(options.path == "/?q=1");
    }

    SECTION("IPv6 literal") {
        const auto options = RequestOptions::from_url("http://[::1]:8080/x");
        REQUIRE(options.hostname == "[::1]");
        REQUIRE(options.port == 8080);
    }

    SECTION("Unparsable port is left unset") {
        const auto options = RequestOptions::from_url("http://example.com:abc/");
        REQUIRE(options.hostname == "example.com");
        REQUIRE(options.port == 0);
    }
}
