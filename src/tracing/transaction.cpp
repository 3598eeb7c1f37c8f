#include "tracing/transaction.hpp"
#include "propagation/outbound_headers.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace apmcore {

namespace {

constexpr std::string_view kRootSegmentName = "ROOT";
constexpr std::string_view kTraceparentHeader = "traceparent";
constexpr std::string_view kTracestateHeader = "tracestate";

} // anonymous namespace

Transaction::Transaction(CreateTag, TransactionType type, FinalizeHandler on_finalize,
                         FinalizedHandler on_finalized)
    : id_(utils::generate_id()),
      type_(type),
      on_finalize_(std::move(on_finalize)),
      on_finalized_(std::move(on_finalized)),
      trip_id_(id_),
      trace_context_(TraceContext::generate()) {}

std::shared_ptr<Transaction> Transaction::create(TransactionType type,
                                                 FinalizeHandler on_finalize,
                                                 FinalizedHandler on_finalized) {
    auto tx = std::make_shared<Transaction>(CreateTag{}, type, std::move(on_finalize),
                                            std::move(on_finalized));
    tx->root_ = std::make_shared<Segment>(tx, std::string(kRootSegmentName), true);
    return tx;
}

// ============================================================================
// Naming
// ============================================================================

std::string Transaction::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

void Transaction::set_name(std::string name) {
    if (is_finalized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    name_ = std::move(name);
}

std::string Transaction::full_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (name_.empty()) return {};
    const char* prefix = (type_ == TransactionType::WEB) ? "WebTransaction/" : "OtherTransaction/";
    return prefix + name_;
}

// ============================================================================
// Cross-process identity
// ============================================================================

std::string Transaction::trip_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trip_id_.empty() ? id_ : trip_id_;
}

void Transaction::set_trip_id(std::string trip_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    trip_id_ = std::move(trip_id);
}

std::optional<std::string> Transaction::referring_path_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return referring_path_hash_;
}

void Transaction::set_referring_path_hash(std::string path_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    referring_path_hash_ = std::move(path_hash);
}

void Transaction::push_path_hash(std::string path_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_hashes_.push_back(std::move(path_hash));
}

std::vector<std::string> Transaction::path_hashes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path_hashes_;
}

bool Transaction::includes_outbound_path(std::string_view path_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(path_hashes_.begin(), path_hashes_.end(), path_hash) != path_hashes_.end();
}

std::string Transaction::synthetics_header() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return synthetics_header_;
}

void Transaction::set_synthetics_header(std::string header) {
    std::lock_guard<std::mutex> lock(mutex_);
    synthetics_header_ = std::move(header);
}

TraceHeaderMode Transaction::select_header_mode(bool distributed_tracing_enabled,
                                                bool cross_application_enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (header_mode_ == TraceHeaderMode::NONE) {
        if (distributed_tracing_enabled) {
            header_mode_ = TraceHeaderMode::DISTRIBUTED_TRACING;
        } else if (cross_application_enabled) {
            header_mode_ = TraceHeaderMode::CROSS_APPLICATION;
        }
        if (header_mode_ != TraceHeaderMode::NONE) {
            utils::log::trace(std::format("Transaction {} propagates with {} headers",
                                          id_, header_mode_to_string(header_mode_)));
        }
    }
    return header_mode_;
}

TraceHeaderMode Transaction::header_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return header_mode_;
}

// ============================================================================
// Distributed tracing
// ============================================================================

TraceContext Transaction::trace_context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trace_context_;
}

bool Transaction::accept_distributed_trace_headers(const HeaderMap& headers) {
    const auto* traceparent = find_header(headers, kTraceparentHeader);
    if (!traceparent) return false;

    auto parsed = TraceContext::parse_traceparent(*traceparent);
    if (!parsed) {
        utils::log::debug(std::format("Transaction {}: ignoring malformed traceparent '{}'",
                                      id_, *traceparent));
        return false;
    }

    if (const auto* tracestate = find_header(headers, kTracestateHeader)) {
        parsed->tracestate = *tracestate;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    trace_context_ = std::move(*parsed);
    return true;
}

void Transaction::insert_distributed_trace_headers(OutboundHeaders& headers,
                                                   const Segment& segment) const {
    const auto ctx = trace_context();
    headers.set(std::string(kTraceparentHeader), ctx.to_traceparent(segment.id()));
    if (!ctx.tracestate.empty()) {
        headers.set(std::string(kTracestateHeader), ctx.tracestate);
    }
}

// ============================================================================
// Outcome
// ============================================================================

std::optional<int> Transaction::status_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_code_;
}

void Transaction::set_status_code(int status_code) {
    if (is_finalized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    status_code_ = status_code;
}

void Transaction::notice_error(std::string message) {
    if (is_finalized()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(std::move(message));
}

std::vector<std::string> Transaction::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

// ============================================================================
// Lifecycle
// ============================================================================

void Transaction::end() {
    State expected = State::ACTIVE;
    if (!state_.compare_exchange_strong(expected, State::FINALIZING, std::memory_order_acq_rel)) {
        return;
    }

    root_->end();
    const auto now = Segment::Clock::now();

    size_t unterminated = 0;
    for_each_segment([&](Segment& segment) {
        if (!segment.is_ended()) {
            segment.mark_unterminated(now);
            ++unterminated;
        }
    });

    if (unterminated > 0) {
        utils::log::warn(std::format("Transaction {} ({}): {} segment(s) never ended, "
                                     "reporting as incomplete", id_, full_name(), unterminated));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        unterminated_count_ = unterminated;
    }

    if (on_finalize_) {
        try {
            on_finalize_(*this);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Transaction {}: finalize handler failed: {}", id_, e.what()));
        }
    }

    state_.store(State::FINALIZED, std::memory_order_release);

    if (on_finalized_) {
        try {
            on_finalized_(*this);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Transaction {}: finalized handler failed: {}", id_, e.what()));
        }
    }
}

std::chrono::microseconds Transaction::duration() const {
    return root_->duration();
}

size_t Transaction::unterminated_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unterminated_count_;
}

void Transaction::for_each_segment(const std::function<void(Segment&)>& fn) const {
    std::vector<std::shared_ptr<Segment>> stack{root_};
    while (!stack.empty()) {
        auto segment = std::move(stack.back());
        stack.pop_back();
        fn(*segment);

        auto children = segment->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }
}

} // namespace apmcore
