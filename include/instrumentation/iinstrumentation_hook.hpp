#pragma once

#include <string>

namespace apmcore {

class Shim;

/**
 * @brief Abstract interface for library instrumentation
 *
 * A hook is run once, with a Shim named after the hook, when it is
 * registered with the agent. It must not let exceptions escape into the
 * host application; the registry logs and contains any that do.
 */
class IInstrumentationHook {
public:
    virtual ~IInstrumentationHook() = default;

    /// Instrumented module name, also used for logging (e.g. "http")
    [[nodiscard]] virtual std::string name() const = 0;

    /// The shim is valid only during this call; keep shim.tracer() instead
    virtual void instrument(Shim& shim) = 0;
};

} // namespace apmcore
