#include "tracing/context.hpp"
#include "tracing/segment.hpp"
#include "tracing/transaction.hpp"

#include <utility>

namespace apmcore {

namespace {

thread_local Context t_current;

} // anonymous namespace

Context Context::for_segment(std::shared_ptr<Segment> segment) {
    Context ctx;
    if (segment) {
        ctx.transaction = segment->transaction();
        ctx.segment = std::move(segment);
    }
    return ctx;
}

const Context& current_context() {
    return t_current;
}

ContextScope::ContextScope(Context context)
    : previous_(std::exchange(t_current, std::move(context))) {}

ContextScope::~ContextScope() {
    t_current = std::move(previous_);
}

} // namespace apmcore
