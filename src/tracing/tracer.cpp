#include "tracing/tracer.hpp"
#include "core/utils.hpp"

#include <format>

namespace apmcore {

std::shared_ptr<Transaction> Tracer::get_transaction() const {
    const auto& ctx = current_context();
    if (ctx.transaction && ctx.transaction->is_active()) {
        return ctx.transaction;
    }
    return nullptr;
}

std::shared_ptr<Segment> Tracer::get_segment() const {
    return current_context().segment;
}

std::shared_ptr<Segment> Tracer::create_segment(std::string name,
                                                SegmentRecorder recorder,
                                                std::shared_ptr<Segment> parent) const {
    if (!parent) {
        parent = get_segment();
    }

    const auto tx = parent ? parent->transaction() : nullptr;
    if (!tx || !tx->is_active()) {
        utils::log::trace(std::format("Not creating segment {}: no active transaction", name));
        return Segment::make_inert(std::move(name));
    }

    return parent->add_child(std::move(name), std::move(recorder));
}

} // namespace apmcore
