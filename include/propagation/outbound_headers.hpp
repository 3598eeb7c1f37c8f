#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace apmcore {

/**
 * @brief Ordered set of headers the agent wants to add to an outbound call
 *
 * Callers hand us either an ordered list of [name, value] pairs or a
 * name -> value mapping. Internally there is a single insertion-ordered
 * map; merge_into() marshals back to whichever shape the caller used.
 */
class OutboundHeaders {
public:
    /// Insert or replace; a replaced entry keeps its original position
    void set(std::string name, std::string value);

    [[nodiscard]] const std::string* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] const HeaderList& entries() const { return entries_; }

    /**
     * @brief Copy-on-write merge into the caller's container
     *
     * The original is never modified. Lists get our entries appended after
     * the caller's; maps get them assigned (same-name caller entries are
     * replaced, all others kept).
     */
    [[nodiscard]] HeaderCarrier merge_into(const HeaderCarrier& original) const;

private:
    HeaderList entries_;
};

/// Case-insensitive lookup in either container shape (first match wins)
[[nodiscard]] const std::string* find_header(const HeaderCarrier& headers, std::string_view name);
[[nodiscard]] const std::string* find_header(const HeaderMap& headers, std::string_view name);

} // namespace apmcore
