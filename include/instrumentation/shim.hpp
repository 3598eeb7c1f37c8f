#pragma once

#include "core/types.hpp"
#include "tracing/context.hpp"
#include "tracing/segment.hpp"
#include "tracing/tracer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace apmcore {

/**
 * @brief Description of one instrumented library call
 */
struct OperationSpec {
    std::string name;
    bool opaque = false;        // nothing below this call is observed
    AttributeMap parameters;    // attached at creation, even when opaque
    SegmentRecorder recorder;
};

/**
 * @brief A started operation and the continuation that completes it
 *
 * Invoking `callback` ends `segment` and runs the caller's callback in the
 * context that was ambient when the operation started.
 */
template<typename Callback>
struct RecordedOperation {
    std::shared_ptr<Segment> segment;
    Callback callback;
};

/**
 * @brief Helper surface handed to instrumentation hooks
 *
 * Wraps the tracer with the operations library instrumentation needs:
 * creating operation segments, binding callbacks, and datastore instance
 * attributes.
 */
class Shim {
public:
    Shim(const Tracer& tracer, std::string module_name)
        : tracer_(tracer), module_name_(std::move(module_name)) {}

    [[nodiscard]] const std::string& module_name() const { return module_name_; }
    [[nodiscard]] const Tracer& tracer() const { return tracer_; }

    /**
     * @brief Create the segment for an operation under the ambient segment
     *
     * operation.parameters are written before the segment becomes opaque.
     */
    std::shared_ptr<Segment> start_operation(const OperationSpec& operation) const;

    /**
     * @brief Start an operation and wrap its completion callback
     */
    template<typename Callback>
    auto record_operation(const OperationSpec& operation, Callback callback) const {
        Context parent = current_context();
        auto segment = start_operation(operation);

        auto wrapped = [segment, parent = std::move(parent), callback = std::move(callback)](
                           auto&&... args) mutable -> decltype(auto) {
            segment->end();
            ContextScope scope(parent);
            return callback(std::forward<decltype(args)>(args)...);
        };

        return RecordedOperation<decltype(wrapped)>{std::move(segment), std::move(wrapped)};
    }

    /// Bind `fn` to `segment` (or to the ambient context when null)
    template<typename Fn>
    auto bind_callback(Fn fn, std::shared_ptr<Segment> segment = nullptr) const {
        return tracer_.bind_function(std::move(fn), std::move(segment));
    }

    /**
     * @brief Datastore instance attributes
     *
     * A host that is really a unix socket path (leading '/' or ".sock"
     * suffix) is reported as port_path_or_id with host "localhost". Empty
     * values are omitted.
     */
    [[nodiscard]] static AttributeMap instance_parameters(std::string_view host,
                                                          std::string_view port_path_or_id,
                                                          std::string_view database_name);

    /**
     * @brief Add instance attributes to the ambient segment
     * @return false when there is no segment or it does not accept attributes
     */
    bool capture_instance_attributes(std::string_view host,
                                     std::string_view port_path_or_id,
                                     std::string_view database_name) const;

private:
    const Tracer& tracer_;
    std::string module_name_;
};

} // namespace apmcore
