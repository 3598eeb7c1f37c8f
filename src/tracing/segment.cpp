#include "tracing/segment.hpp"
#include "tracing/transaction.hpp"
#include "core/utils.hpp"

#include <format>

namespace apmcore {

Segment::Segment(std::weak_ptr<Transaction> transaction, std::string name, bool recording)
    : id_(utils::generate_id()),
      transaction_(std::move(transaction)),
      recording_(recording),
      name_(std::move(name)),
      start_time_(Clock::now()) {}

std::shared_ptr<Segment> Segment::make_inert(std::string name) {
    return std::make_shared<Segment>(std::weak_ptr<Transaction>{}, std::move(name), false);
}

std::string Segment::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

void Segment::set_name(std::string name) {
    if (is_frozen()) {
        utils::log::trace(std::format("Segment {}: name frozen, ignoring rename to {}", id_, name));
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    name_ = std::move(name);
}

void Segment::append_name(std::string_view suffix) {
    if (is_frozen()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    name_.append(suffix);
}

std::shared_ptr<Transaction> Segment::transaction() const {
    return transaction_.lock();
}

bool Segment::is_opaque() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opaque_;
}

void Segment::set_opaque(bool opaque) {
    std::lock_guard<std::mutex> lock(mutex_);
    opaque_ = opaque;
}

// ============================================================================
// Timing
// ============================================================================

void Segment::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (end_time_ || !children_.empty()) return;
    start_time_ = Clock::now();
    touched_at_.reset();
}

void Segment::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (end_time_) return;
    touched_at_ = Clock::now();
}

void Segment::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (end_time_) return;
    end_time_ = Clock::now();
}

bool Segment::is_ended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_.has_value();
}

Segment::Clock::time_point Segment::start_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_time_;
}

std::optional<Segment::Clock::time_point> Segment::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

std::chrono::microseconds Segment::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto stop = end_time_ ? end_time_ : touched_at_;
    if (!stop) return std::chrono::microseconds{0};
    return std::chrono::duration_cast<std::chrono::microseconds>(*stop - start_time_);
}

bool Segment::is_unterminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unterminated_;
}

void Segment::mark_unterminated(Clock::time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (end_time_) return;
    unterminated_ = true;
    if (!touched_at_) touched_at_ = at;
}

// ============================================================================
// Tree
// ============================================================================

std::shared_ptr<Segment> Segment::add_child(std::string name, SegmentRecorder recorder) {
    const bool capture = recording_ && !is_opaque() && !is_frozen();

    auto child = std::make_shared<Segment>(transaction_, std::move(name), capture);
    if (!capture) {
        // Everything below stays unobserved too
        child->set_opaque(true);
        return child;
    }

    child->recorder_ = std::move(recorder);

    std::lock_guard<std::mutex> lock(mutex_);
    children_.push_back(child);
    return child;
}

std::vector<std::shared_ptr<Segment>> Segment::children() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return children_;
}

// ============================================================================
// Attributes
// ============================================================================

bool Segment::accepts_attributes() const {
    return recording_ && !is_opaque() && !is_frozen();
}

bool Segment::add_attribute(const std::string& key, AttributeValue value) {
    if (!accepts_attributes()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    attributes_.insert_or_assign(key, std::move(value));
    return true;
}

bool Segment::add_span_attribute(const std::string& key, AttributeValue value) {
    if (!accepts_attributes()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    span_attributes_.insert_or_assign(key, std::move(value));
    return true;
}

AttributeMap Segment::attributes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attributes_;
}

AttributeMap Segment::span_attributes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return span_attributes_;
}

// ============================================================================
// Cross-process link
// ============================================================================

void Segment::set_cat_link(std::string cat_id, std::string cat_transaction) {
    if (is_frozen()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    cat_id_ = std::move(cat_id);
    cat_transaction_ = std::move(cat_transaction);
}

std::string Segment::cat_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cat_id_;
}

std::string Segment::cat_transaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cat_transaction_;
}

// ============================================================================
// Metrics
// ============================================================================

SegmentRecorder Segment::recorder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorder_;
}

void Segment::set_recorder(SegmentRecorder recorder) {
    std::lock_guard<std::mutex> lock(mutex_);
    recorder_ = std::move(recorder);
}

bool Segment::is_frozen() const {
    const auto tx = transaction_.lock();
    return tx && tx->is_finalized();
}

} // namespace apmcore
