#pragma once

#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apmcore {

class Transaction;
class Segment;
class MetricAggregator;

/**
 * @brief Turns a finished segment into metrics
 *
 * Invoked once per segment when its transaction is finalized.
 */
using SegmentRecorder = std::function<void(const Segment& segment,
                                           const Transaction& transaction,
                                           MetricAggregator& metrics)>;

/**
 * @brief One timed node of work within a transaction
 *
 * Lifecycle: created under a parent (never reparented), ended exactly once.
 * Name and attributes stay mutable until the owning transaction is
 * finalized.
 *
 * Two flags gate data capture:
 * - recording: false for inert placeholders (no transaction) and for
 *   segments created below an opaque parent. Such segments are never linked
 *   into the tree and drop every attribute.
 * - opaque: the operation is measured as a whole; nothing underneath it is
 *   observed and the public attribute APIs are no-ops on it.
 *
 * Thread-safety: mutation follows the owning transaction's cooperative
 * model; the internal mutex only keeps concurrent readers consistent.
 */
class Segment {
public:
    using Clock = std::chrono::steady_clock;

    Segment(std::weak_ptr<Transaction> transaction, std::string name, bool recording);

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    /// Placeholder handed out when no transaction is active
    [[nodiscard]] static std::shared_ptr<Segment> make_inert(std::string name);

    [[nodiscard]] const std::string& id() const { return id_; }

    [[nodiscard]] std::string name() const;
    void set_name(std::string name);
    void append_name(std::string_view suffix);

    [[nodiscard]] std::shared_ptr<Transaction> transaction() const;

    [[nodiscard]] bool is_recording() const { return recording_; }
    [[nodiscard]] bool is_opaque() const;
    void set_opaque(bool opaque);

    // ---- Timing ----

    /// Restart the timer; ignored once the segment has children or has ended
    void start();

    /// Record a provisional end time without ending the segment
    void touch();

    /// Idempotent: only the first call records an end time
    void end();

    [[nodiscard]] bool is_ended() const;
    [[nodiscard]] Clock::time_point start_time() const;
    [[nodiscard]] std::optional<Clock::time_point> end_time() const;

    /// Ended: end - start. Otherwise up to the last touch, or zero.
    [[nodiscard]] std::chrono::microseconds duration() const;

    /// Set at finalization when the segment never ended
    [[nodiscard]] bool is_unterminated() const;

    // ---- Tree ----

    /**
     * @brief Create a child in creation order
     *
     * Below an opaque or non-recording segment the child is still returned
     * but is non-recording, opaque, and not linked into the tree.
     */
    std::shared_ptr<Segment> add_child(std::string name, SegmentRecorder recorder = {});

    [[nodiscard]] std::vector<std::shared_ptr<Segment>> children() const;

    // ---- Attributes ----

    /// @return false when the write was dropped (opaque, non-recording, finalized)
    bool add_attribute(const std::string& key, AttributeValue value);
    bool add_span_attribute(const std::string& key, AttributeValue value);

    [[nodiscard]] AttributeMap attributes() const;
    [[nodiscard]] AttributeMap span_attributes() const;

    // ---- Cross-process link ----

    void set_cat_link(std::string cat_id, std::string cat_transaction);
    [[nodiscard]] std::string cat_id() const;
    [[nodiscard]] std::string cat_transaction() const;

    // ---- Metrics ----

    [[nodiscard]] SegmentRecorder recorder() const;
    void set_recorder(SegmentRecorder recorder);

private:
    friend class Transaction;

    [[nodiscard]] bool is_frozen() const;
    [[nodiscard]] bool accepts_attributes() const;
    void mark_unterminated(Clock::time_point at);

    const std::string id_;
    const std::weak_ptr<Transaction> transaction_;
    const bool recording_;

    mutable std::mutex mutex_;
    std::string name_;
    bool opaque_ = false;

    Clock::time_point start_time_;
    std::optional<Clock::time_point> end_time_;
    std::optional<Clock::time_point> touched_at_;
    bool unterminated_ = false;

    std::vector<std::shared_ptr<Segment>> children_;
    AttributeMap attributes_;
    AttributeMap span_attributes_;

    std::string cat_id_;
    std::string cat_transaction_;

    SegmentRecorder recorder_;
};

} // namespace apmcore
