#pragma once

#include "tracing/context.hpp"
#include "tracing/segment.hpp"
#include "tracing/transaction.hpp"

#include <memory>
#include <string>
#include <utility>

namespace apmcore {

/**
 * @brief Segment creation and context propagation
 *
 * The tracer itself holds no "current segment"; the ambient context lives in
 * a per-thread slot that only ContextScope changes. Work that resumes later
 * (I/O callbacks, timers, event handlers) gets its context back by being
 * wrapped with bind_function() at the time it is scheduled.
 *
 * Usage:
 *   tracer.add_segment("External/host/path", recorder, nullptr, false,
 *       [&](const std::shared_ptr<Segment>& segment) {
 *           auto on_done = tracer.bind_function([segment](int status) {
 *               segment->end();
 *           });
 *           start_async_io(std::move(on_done));
 *       });
 */
class Tracer {
public:
    /// Ambient transaction, only while it is still active
    [[nodiscard]] std::shared_ptr<Transaction> get_transaction() const;

    /// Ambient segment (may be null, may be non-recording)
    [[nodiscard]] std::shared_ptr<Segment> get_segment() const;

    /**
     * @brief Create a segment under `parent`, or under the ambient segment
     *
     * Never fails: without an active transaction an inert placeholder is
     * returned, and below an opaque parent the result is non-recording.
     */
    std::shared_ptr<Segment> create_segment(std::string name,
                                            SegmentRecorder recorder = {},
                                            std::shared_ptr<Segment> parent = nullptr) const;

    /// Alias of create_segment with the parent first
    std::shared_ptr<Segment> start_segment(std::shared_ptr<Segment> parent, std::string name) const {
        return create_segment(std::move(name), {}, std::move(parent));
    }

    /// Idempotent end of a segment
    void end_segment(const std::shared_ptr<Segment>& segment) const {
        if (segment) segment->end();
    }

    /**
     * @brief Create a segment and run `handler(segment)` with it ambient
     *
     * Anything bound during the handler's synchronous extent inherits the
     * new segment. With `is_root` the segment's timer restarts on entry and
     * is touched on exit.
     *
     * @return Whatever the handler returns
     */
    template<typename Handler>
    decltype(auto) add_segment(std::string name,
                               SegmentRecorder recorder,
                               std::shared_ptr<Segment> parent,
                               bool is_root,
                               Handler&& handler) const {
        auto segment = create_segment(std::move(name), std::move(recorder), std::move(parent));
        ContextScope scope(Context::for_segment(segment));
        TouchOnExit touch(is_root ? segment.get() : nullptr);
        return std::forward<Handler>(handler)(segment);
    }

    /**
     * @brief Bind a continuation to a segment
     *
     * Each invocation of the returned callable installs `segment` (or, when
     * null, the context that was ambient at bind time) and restores the
     * caller's context when it returns. May be invoked any number of times,
     * from any nesting depth.
     */
    template<typename Fn>
    auto bind_function(Fn fn, std::shared_ptr<Segment> segment = nullptr) const {
        Context ctx = segment ? Context::for_segment(std::move(segment)) : current_context();
        return [ctx = std::move(ctx), fn = std::move(fn)](auto&&... args) mutable -> decltype(auto) {
            ContextScope scope(ctx);
            return fn(std::forward<decltype(args)>(args)...);
        };
    }

    /// Run `fn` synchronously with `segment` ambient
    template<typename Fn>
    decltype(auto) run_in_segment(std::shared_ptr<Segment> segment, Fn&& fn) const {
        ContextScope scope(Context::for_segment(std::move(segment)));
        return std::forward<Fn>(fn)();
    }

private:
    class TouchOnExit {
    public:
        explicit TouchOnExit(Segment* segment) : segment_(segment) {
            if (segment_) segment_->start();
        }
        ~TouchOnExit() {
            if (segment_) segment_->touch();
        }

        TouchOnExit(const TouchOnExit&) = delete;
        TouchOnExit& operator=(const TouchOnExit&) = delete;

    private:
        Segment* segment_;
    };
};

} // namespace apmcore
