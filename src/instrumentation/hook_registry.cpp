#include "instrumentation/hook_registry.hpp"
#include "instrumentation/shim.hpp"
#include "core/utils.hpp"

#include <format>

namespace apmcore {

bool HookRegistry::register_hook(std::unique_ptr<IInstrumentationHook> hook) {
    if (!hook) return false;
    const auto name = hook->name();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (contains_locked(name) || !pending_.insert(name).second) {
            utils::log::warn(std::format("Instrumentation for {} already registered, skipping", name));
            return false;
        }
    }

    // instrument() runs unlocked so hooks may query or extend the registry
    Shim shim(tracer_, name);
    try {
        hook->instrument(shim);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Instrumentation for {} failed: {}", name, e.what()));
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(name);
        return false;
    }

    utils::log::debug(std::format("Instrumented {}", name));
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(name);
    hooks_.push_back(std::move(hook));
    return true;
}

bool HookRegistry::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contains_locked(name);
}

bool HookRegistry::contains_locked(const std::string& name) const {
    for (const auto& hook : hooks_) {
        if (hook->name() == name) return true;
    }
    return false;
}

size_t HookRegistry::hook_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hooks_.size();
}

} // namespace apmcore
