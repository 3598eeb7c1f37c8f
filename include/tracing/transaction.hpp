#pragma once

#include "core/types.hpp"
#include "tracing/segment.hpp"
#include "tracing/trace_context.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apmcore {

class OutboundHeaders;

/**
 * @brief One logical unit of observed work and its segment tree
 *
 * States:
 * - ACTIVE:     segments may be created; names and attributes mutable
 * - FINALIZING: end() is running the finalize handler; no new segments,
 *               names may still be rewritten (normalization)
 * - FINALIZED:  tree frozen, eligible for aggregation
 *
 * end() runs exactly once. Segments still open at that point are marked
 * unterminated and kept in the tree.
 */
class Transaction : public std::enable_shared_from_this<Transaction> {
    // Restricts construction to create() while still allowing make_shared
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    enum class State { ACTIVE, FINALIZING, FINALIZED };

    /// Runs while FINALIZING: names may still be rewritten
    using FinalizeHandler = std::function<void(Transaction&)>;

    /// Runs once FINALIZED: read-only view of the frozen tree
    using FinalizedHandler = std::function<void(const Transaction&)>;

    [[nodiscard]] static std::shared_ptr<Transaction> create(
        TransactionType type,
        FinalizeHandler on_finalize = {},
        FinalizedHandler on_finalized = {});

    Transaction(CreateTag, TransactionType type, FinalizeHandler on_finalize,
                FinalizedHandler on_finalized);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] TransactionType type() const { return type_; }

    // ---- Naming ----

    [[nodiscard]] std::string name() const;
    void set_name(std::string name);

    /// "WebTransaction/<name>" or "OtherTransaction/<name>"; "" while unnamed
    [[nodiscard]] std::string full_name() const;

    // ---- Cross-process identity ----

    /// Defaults to the transaction id
    [[nodiscard]] std::string trip_id() const;
    void set_trip_id(std::string trip_id);

    [[nodiscard]] std::optional<std::string> referring_path_hash() const;
    void set_referring_path_hash(std::string path_hash);

    void push_path_hash(std::string path_hash);
    [[nodiscard]] std::vector<std::string> path_hashes() const;
    [[nodiscard]] bool includes_outbound_path(std::string_view path_hash) const;

    [[nodiscard]] std::string synthetics_header() const;
    void set_synthetics_header(std::string header);

    /**
     * @brief Pick the header family for outbound calls
     *
     * The first call decides (distributed tracing wins when both are
     * enabled); later calls return the recorded choice so one transaction
     * never mixes header families.
     */
    TraceHeaderMode select_header_mode(bool distributed_tracing_enabled,
                                       bool cross_application_enabled);
    [[nodiscard]] TraceHeaderMode header_mode() const;

    // ---- Distributed tracing ----

    [[nodiscard]] TraceContext trace_context() const;

    /// Continue the caller's trace from an inbound traceparent/tracestate
    bool accept_distributed_trace_headers(const HeaderMap& headers);

    /// Add traceparent (and tracestate) naming `segment` as the parent span
    void insert_distributed_trace_headers(OutboundHeaders& headers, const Segment& segment) const;

    // ---- Outcome ----

    [[nodiscard]] std::optional<int> status_code() const;
    void set_status_code(int status_code);

    void notice_error(std::string message);
    [[nodiscard]] std::vector<std::string> errors() const;

    // ---- Tree & lifecycle ----

    [[nodiscard]] std::shared_ptr<Segment> root_segment() const { return root_; }

    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_active() const { return state() == State::ACTIVE; }
    [[nodiscard]] bool is_finalized() const { return state() == State::FINALIZED; }

    /// Idempotent; the first call finalizes
    void end();

    [[nodiscard]] std::chrono::microseconds duration() const;
    [[nodiscard]] size_t unterminated_count() const;

    /// Depth-first, parents before children, children in creation order
    void for_each_segment(const std::function<void(Segment&)>& fn) const;

private:
    const std::string id_;
    const TransactionType type_;
    FinalizeHandler on_finalize_;
    FinalizedHandler on_finalized_;
    std::shared_ptr<Segment> root_;

    std::atomic<State> state_{State::ACTIVE};

    mutable std::mutex mutex_;
    std::string name_;
    std::string trip_id_;
    std::optional<std::string> referring_path_hash_;
    std::vector<std::string> path_hashes_;
    std::string synthetics_header_;
    TraceHeaderMode header_mode_ = TraceHeaderMode::NONE;
    TraceContext trace_context_;
    std::optional<int> status_code_;
    std::vector<std::string> errors_;
    size_t unterminated_count_ = 0;
};

} // namespace apmcore
