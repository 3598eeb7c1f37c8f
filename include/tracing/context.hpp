#pragma once

#include <memory>

namespace apmcore {

class Transaction;
class Segment;

/**
 * @brief Ambient tracing state: which transaction and segment work belongs to
 *
 * A value type. Continuations capture one when they are bound and re-install
 * it for the duration of each invocation.
 */
struct Context {
    std::shared_ptr<Transaction> transaction;
    std::shared_ptr<Segment> segment;

    /// Context for `segment` and its owning transaction (null-safe)
    [[nodiscard]] static Context for_segment(std::shared_ptr<Segment> segment);

    [[nodiscard]] bool has_transaction() const { return transaction != nullptr; }
};

/**
 * @brief Ambient context of the calling thread of control
 *
 * One slot per thread. It is only ever changed through ContextScope, so an
 * outer context is always restored when nested work returns.
 */
[[nodiscard]] const Context& current_context();

/**
 * @brief RAII installation of an ambient context
 *
 * Usage:
 *   {
 *       ContextScope scope(Context::for_segment(segment));
 *       // code here sees `segment` as current
 *   } // previous context restored
 *
 * Scopes nest; each restores exactly what it replaced.
 */
class ContextScope {
public:
    explicit ContextScope(Context context);
    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;

private:
    Context previous_;
};

} // namespace apmcore
