#pragma once

#include "core/types.hpp"
#include "instrumentation/event_emitter.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace apmcore {

class Agent;

/**
 * @brief Options for one outbound HTTP request
 *
 * Mirrors what an HTTP client takes: the agent only reads these and adds
 * headers to a copy.
 */
struct RequestOptions {
    std::string protocol;        // "http:", "https:" or "" (plain http)
    std::string hostname;
    std::string host;            // used when hostname is empty
    int port = 0;                // 0 = unset
    int default_port = 0;        // transport default, 0 = unset
    std::string method;          // "" = GET
    std::string path = "/";
    HeaderCarrier headers = HeaderMap{};

    /// Set by instrumentation that must not carry traceparent (e.g. the agent's own calls)
    bool disable_distributed_tracing = false;

    /**
     * @brief Options from an absolute URL ("https://host:8443/p?q=1")
     *
     * Unparsable ports are left unset.
     */
    [[nodiscard]] static RequestOptions from_url(std::string_view url);
};

/// Transport entry point being instrumented; returns the started request
using MakeRequest = std::function<std::shared_ptr<ClientRequest>(const RequestOptions&)>;

/**
 * @brief Make `make_request` observable as an External segment
 *
 * Without an active transaction, below an opaque segment, or with an
 * invalid host/port the request is made unobserved. Otherwise the call gets
 * an External/<host>[:port]/<path> segment that ends with the response's
 * END event (or with an ERROR event), and propagation headers for the
 * enabled protocol are merged into a copy of options.headers.
 */
std::shared_ptr<ClientRequest> instrument_outbound(Agent& agent,
                                                   RequestOptions options,
                                                   const MakeRequest& make_request);

} // namespace apmcore
