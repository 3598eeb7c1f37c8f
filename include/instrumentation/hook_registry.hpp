#pragma once

#include "instrumentation/iinstrumentation_hook.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace apmcore {

class Tracer;

class HookRegistry {
public:
    explicit HookRegistry(const Tracer& tracer) : tracer_(tracer) {}

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    /**
     * @brief Register and immediately run a hook
     * @return false when a hook with the same name is already registered,
     *         or when the hook threw while instrumenting
     *
     * The hook's instrument() runs without the registry lock held; its name
     * is reserved meanwhile so concurrent duplicates are still rejected.
     */
    bool register_hook(std::unique_ptr<IInstrumentationHook> hook);

    [[nodiscard]] bool is_registered(const std::string& name) const;
    [[nodiscard]] size_t hook_count() const;

private:
    [[nodiscard]] bool contains_locked(const std::string& name) const;

    const Tracer& tracer_;
    std::vector<std::unique_ptr<IInstrumentationHook>> hooks_;
    std::unordered_set<std::string> pending_;
    mutable std::mutex mutex_;
};

} // namespace apmcore
