#pragma once

#include "core/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apmcore {

class Segment;
class Tracer;
class IncomingResponse;

enum class HttpEventType { RESPONSE, DATA, END, ERROR };

struct HttpEvent {
    HttpEventType type;
    std::shared_ptr<IncomingResponse> response;  // RESPONSE only
    std::string payload;                         // DATA chunk or ERROR message
};

/**
 * @brief Minimal event source for transport callbacks
 *
 * emit() goes through a replaceable dispatch function so instrumentation
 * can interpose on every event (wrap_emit). Listeners for one emitter run
 * in registration order, in the order events are emitted.
 */
class EventEmitter {
public:
    using Listener = std::function<void(const HttpEvent&)>;
    using EmitFn = std::function<bool(const HttpEvent&)>;
    using EmitWrapper = std::function<EmitFn(EmitFn)>;

    EventEmitter();
    virtual ~EventEmitter() = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    void on(HttpEventType type, Listener listener);
    [[nodiscard]] size_t listener_count(HttpEventType type) const;

    /// @return true when at least one listener ran
    bool emit(const HttpEvent& event);

    /// Replace the dispatch function with wrapper(current dispatch function)
    void wrap_emit(const EmitWrapper& wrapper);

protected:
    bool dispatch(const HttpEvent& event);

private:
    mutable std::mutex mutex_;
    std::map<HttpEventType, std::vector<Listener>> listeners_;
    EmitFn emit_;
};

/**
 * @brief Response side of an outbound HTTP call
 */
class IncomingResponse : public EventEmitter {
public:
    IncomingResponse(int status_code, std::string status_message, HeaderMap headers = {})
        : status_code_(status_code),
          status_message_(std::move(status_message)),
          headers_(std::move(headers)) {}

    [[nodiscard]] int status_code() const { return status_code_; }
    [[nodiscard]] const std::string& status_message() const { return status_message_; }
    [[nodiscard]] const HeaderMap& headers() const { return headers_; }

private:
    int status_code_;
    std::string status_message_;
    HeaderMap headers_;
};

/**
 * @brief Request side of an outbound HTTP call, as handed back by the transport
 */
class ClientRequest : public EventEmitter {
public:
    explicit ClientRequest(std::string path, HeaderCarrier headers = HeaderMap{})
        : path_(std::move(path)), headers_(std::move(headers)) {}

    /// Request target including any query string
    [[nodiscard]] const std::string& path() const { return path_; }

    /// Headers actually sent
    [[nodiscard]] const HeaderCarrier& headers() const { return headers_; }

    [[nodiscard]] std::shared_ptr<Segment> segment() const { return segment_; }
    void set_segment(std::shared_ptr<Segment> segment) { segment_ = std::move(segment); }

private:
    std::string path_;
    HeaderCarrier headers_;
    std::shared_ptr<Segment> segment_;
};

/**
 * @brief Run every event of `emitter` inside `segment`'s context
 *
 * Null `segment` binds the context that is ambient now.
 */
void bind_emitter(const Tracer& tracer, EventEmitter& emitter, std::shared_ptr<Segment> segment = nullptr);

} // namespace apmcore
