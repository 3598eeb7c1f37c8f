#include "instrumentation/event_emitter.hpp"
#include "tracing/tracer.hpp"

namespace apmcore {

EventEmitter::EventEmitter()
    : emit_([this](const HttpEvent& event) { return dispatch(event); }) {}

void EventEmitter::on(HttpEventType type, Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_[type].push_back(std::move(listener));
}

size_t EventEmitter::listener_count(HttpEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = listeners_.find(type);
    return it == listeners_.end() ? 0 : it->second.size();
}

bool EventEmitter::emit(const HttpEvent& event) {
    EmitFn emit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        emit = emit_;
    }
    return emit(event);
}

void EventEmitter::wrap_emit(const EmitWrapper& wrapper) {
    std::lock_guard<std::mutex> lock(mutex_);
    emit_ = wrapper(std::move(emit_));
}

bool EventEmitter::dispatch(const HttpEvent& event) {
    // Copy so listeners may register further listeners
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = listeners_.find(event.type);
        if (it == listeners_.end() || it->second.empty()) return false;
        listeners = it->second;
    }

    for (const auto& listener : listeners) {
        listener(event);
    }
    return true;
}

void bind_emitter(const Tracer& tracer, EventEmitter& emitter, std::shared_ptr<Segment> segment) {
    emitter.wrap_emit([&tracer, segment = std::move(segment)](EventEmitter::EmitFn emit) {
        return EventEmitter::EmitFn(tracer.bind_function(std::move(emit), segment));
    });
}

} // namespace apmcore
