#include "instrumentation/http_outbound.hpp"
#include "agent/agent.hpp"
#include "core/url_utils.hpp"
#include "core/utils.hpp"
#include "metrics/metric_names.hpp"
#include "metrics/recorders.hpp"
#include "propagation/cross_app_tracing.hpp"
#include "propagation/outbound_headers.hpp"

#include <format>

namespace apmcore {

namespace {

constexpr std::string_view kDefaultHost = "localhost";
constexpr int kDefaultPort = 80;
constexpr int kDefaultSslPort = 443;
constexpr std::string_view kLibrary = "http";

/**
 * @brief Record the error on the transaction unless the caller handles it
 * @return true when the agent collected the error
 */
bool handle_error(Segment& segment, const ClientRequest& request, const HttpEvent& event) {
    if (request.listener_count(HttpEventType::ERROR) > 0) {
        utils::log::trace(std::format(
            "Not capturing outbound error because user has already handled it: {}", event.payload));
        return false;
    }

    utils::log::trace(std::format("Captured outbound error on behalf of the user: {}", event.payload));
    if (const auto tx = segment.transaction()) {
        tx->notice_error(event.payload);
    }
    return true;
}

void handle_response(Agent& agent,
                     const std::shared_ptr<Segment>& segment,
                     const std::string& host,
                     IncomingResponse& response) {
    segment->add_span_attribute("http.statusCode", static_cast<int64_t>(response.status_code()));
    segment->add_span_attribute("http.statusText", response.status_message());

    if (agent.cat_enabled() && !agent.distributed_tracing_enabled()) {
        cat::pull_cat_headers(*agent.server_settings(), *segment, host,
                              find_header(response.headers(), cat::kAppDataHeader));
    }

    // The segment covers the call until the body has been consumed
    const Tracer& tracer = agent.tracer();
    response.wrap_emit([&tracer, segment](EventEmitter::EmitFn emit) {
        auto bound = tracer.bind_function(std::move(emit), segment);
        return EventEmitter::EmitFn(
            [segment, bound = std::move(bound)](const HttpEvent& event) mutable {
                if (event.type == HttpEventType::END) {
                    segment->end();
                }
                return bound(event);
            });
    });
}

void add_propagation_headers(Agent& agent,
                             const RequestOptions& options,
                             Transaction& transaction,
                             const Segment& segment,
                             OutboundHeaders& outbound) {
    const auto settings = agent.server_settings();

    if (settings->encoding_key) {
        if (auto synthetics = transaction.synthetics_header(); !synthetics.empty()) {
            outbound.set(std::string(cat::kSyntheticsHeader), std::move(synthetics));
        }
    }

    switch (transaction.select_header_mode(agent.distributed_tracing_enabled(), agent.cat_enabled())) {
        case TraceHeaderMode::DISTRIBUTED_TRACING:
            if (options.disable_distributed_tracing) {
                utils::log::trace("Distributed tracing disabled by instrumentation.");
            } else {
                transaction.insert_distributed_trace_headers(outbound, segment);
            }
            break;
        case TraceHeaderMode::CROSS_APPLICATION:
            cat::add_cat_headers(*settings, agent.config().primary_application(), transaction, outbound);
            break;
        case TraceHeaderMode::NONE:
            utils::log::trace("CAT disabled, not adding headers!");
            break;
    }
}

std::shared_ptr<ClientRequest> instrument_request(Agent& agent,
                                                  RequestOptions options,
                                                  const MakeRequest& make_request,
                                                  const std::shared_ptr<Segment>& segment,
                                                  const std::string& hostname) {
    const auto transaction = segment->transaction();
    if (!transaction) {
        return make_request(options);
    }

    OutboundHeaders outbound;
    add_propagation_headers(agent, options, *transaction, *segment, outbound);
    options.headers = outbound.merge_into(options.headers);

    segment->start();
    auto request = make_request(options);
    if (!request) {
        utils::log::warn(std::format("Transport returned no request for {}", segment->name()));
        segment->end();
        return request;
    }

    const auto parsed = url::scrub_and_parse_parameters(request->path());
    const std::string proto = !parsed.protocol.empty() ? parsed.protocol
                            : !options.protocol.empty() ? options.protocol
                            : std::string("http:");
    segment->append_name(parsed.path);
    request->set_segment(segment);

    for (const auto& [key, value] : parsed.parameters) {
        segment->add_span_attribute("request.parameters." + key, value);
    }
    segment->add_attribute("url", std::format("{}//{}{}", proto, hostname, parsed.path));
    segment->add_attribute("procedure", options.method.empty() ? std::string("GET") : options.method);

    // The request owns its emit chain, so the chain refers back to it by raw pointer
    ClientRequest* raw_request = request.get();
    request->wrap_emit([&agent, segment, hostname, raw_request](EventEmitter::EmitFn emit) {
        auto bound = agent.tracer().bind_function(std::move(emit), segment);
        return EventEmitter::EmitFn(
            [&agent, segment, hostname, raw_request, bound = std::move(bound)](
                const HttpEvent& event) mutable {
                if (event.type == HttpEventType::ERROR) {
                    segment->end();
                    handle_error(*segment, *raw_request, event);
                } else if (event.type == HttpEventType::RESPONSE && event.response) {
                    handle_response(agent, segment, hostname, *event.response);
                }
                return bound(event);
            });
    });

    return request;
}

} // anonymous namespace

RequestOptions RequestOptions::from_url(std::string_view url) {
    RequestOptions options;
    std::string_view rest = url;

    if (const auto scheme = rest.find("://"); scheme != std::string_view::npos) {
        options.protocol = utils::to_lower(rest.substr(0, scheme)) + ":";
        rest.remove_prefix(scheme + 3);
    }

    const auto path_start = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, path_start);
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    // "[::1]:8080" keeps its brackets in the host
    size_t port_sep = authority.rfind(':');
    if (port_sep != std::string_view::npos && authority.starts_with('[')) {
        const auto close = authority.find(']');
        if (close == std::string_view::npos || port_sep < close) port_sep = std::string_view::npos;
    }

    if (port_sep != std::string_view::npos) {
        options.hostname = std::string(authority.substr(0, port_sep));
        options.port = utils::parse_int_strict<int>(authority.substr(port_sep + 1)).value_or(0);
    } else {
        options.hostname = std::string(authority);
    }

    if (path_start != std::string_view::npos) {
        options.path = std::string(rest.substr(path_start));
        if (options.path.front() != '/') options.path.insert(0, "/");
    }
    return options;
}

std::shared_ptr<ClientRequest> instrument_outbound(Agent& agent,
                                                   RequestOptions options,
                                                   const MakeRequest& make_request) {
    std::string hostname = !options.hostname.empty() ? options.hostname
                         : !options.host.empty()     ? options.host
                         : std::string(kDefaultHost);

    int port = options.port != 0 ? options.port : options.default_port;
    if (port == 0) {
        port = (options.protocol.empty() || options.protocol == "http:") ? kDefaultPort : kDefaultSslPort;
    }

    if (hostname.empty() || port < 1) {
        utils::log::warn(std::format("Invalid host name ({}) or port ({}) for outbound request.",
                                     hostname, port));
        return make_request(options);
    }

    if (port != kDefaultPort) {
        hostname += std::format(":{}", port);
    }

    const auto name = std::format("{}{}", metric_names::kExternalPrefix, hostname);
    const Tracer& tracer = agent.tracer();

    const auto parent = tracer.get_segment();
    if (parent && parent->is_opaque()) {
        utils::log::trace(std::format(
            "Not capturing data for outbound request ({}) because parent segment opaque ({})",
            name, parent->name()));
        return make_request(options);
    }

    if (!tracer.get_transaction()) {
        utils::log::trace(std::format("Not capturing data for outbound request ({}): no transaction",
                                      name));
        return make_request(options);
    }

    return tracer.add_segment(
        name, recorders::record_external(hostname, std::string(kLibrary)), parent, false,
        [&](const std::shared_ptr<Segment>& segment) {
            return instrument_request(agent, std::move(options), make_request, segment, hostname);
        });
}

} // namespace apmcore
