#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace apmcore {

/**
 * @brief One transaction segment term rule
 *
 * prefix always has the form "<a>/<b>/".
 */
struct TermRule {
    std::string prefix;
    std::unordered_set<std::string> terms;
};

struct NormalizationResult {
    bool matched = false;
    bool ignore = false;  // term rules never ignore a name
    std::string value;
};

/**
 * @brief Segment-term normalization of metric names
 *
 * normalize() uses the first rule whose prefix starts the name. The rest of
 * the name is split on '/'; segments on the rule's allow-list are kept and
 * every run of other segments collapses to a single '*'.
 *
 *   prefix "WebTransaction/foo/", terms {one, two}
 *     WebTransaction/foo/one/two/three/four -> WebTransaction/foo/one/two/*
 *     WebTransaction/foo/one/x/y            -> WebTransaction/foo/one/*
 *
 * Thread-safety: hot-reloadable via RCU (atomic shared_ptr). Readers never
 * block and always see a complete rule list.
 */
class SegmentNormalizer {
public:
    using RuleList = std::vector<TermRule>;

    SegmentNormalizer();

    /**
     * @brief Replace the rule list from a transaction_segment_terms document
     *
     * A non-array input is logged and leaves the current rules in place.
     * @return true when the rules were replaced
     */
    bool load(const nlohmann::json& rules);

    /// Install an already-filtered rule list
    void load_rules(RuleList rules);

    [[nodiscard]] NormalizationResult normalize(std::string_view path) const;

    [[nodiscard]] size_t rule_count() const;
    [[nodiscard]] std::shared_ptr<const RuleList> rules() const;

    /**
     * @brief Validate and deduplicate raw rules
     *
     * Drops rules whose prefix is missing, empty or not a string, whose
     * prefix (after adding a trailing '/') does not have exactly two
     * non-empty segments, or whose terms are not an array. A later rule
     * with the same prefix replaces the earlier one in its position.
     */
    [[nodiscard]] static RuleList filter_rules(const nlohmann::json& rules);

private:
    std::shared_ptr<const RuleList> rules_;
    std::mutex reload_mutex_;
};

} // namespace apmcore
