#include "metrics/segment_normalizer.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <format>

namespace apmcore {

SegmentNormalizer::SegmentNormalizer()
    : rules_(std::make_shared<const RuleList>()) {}

bool SegmentNormalizer::load(const nlohmann::json& rules) {
    if (!rules.is_array()) {
        utils::log::warn(std::format("transaction_segment_terms was not an array got: {} ({})",
                                     rules.type_name(), rules.dump()));
        return false;
    }

    load_rules(filter_rules(rules));
    return true;
}

void SegmentNormalizer::load_rules(RuleList rules) {
    auto new_rules = std::make_shared<const RuleList>(std::move(rules));

    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&rules_, new_rules, std::memory_order_release);
    utils::log::debug(std::format("Loaded {} segment term rule(s)", new_rules->size()));
}

SegmentNormalizer::RuleList SegmentNormalizer::filter_rules(const nlohmann::json& rules) {
    RuleList filtered;

    for (const auto& rule : rules) {
        if (!rule.is_object()) continue;

        const auto prefix_it = rule.find("prefix");
        if (prefix_it == rule.end() || !prefix_it->is_string()) continue;

        auto prefix = prefix_it->get<std::string>();
        if (prefix.empty()) continue;
        if (prefix.back() != '/') prefix += '/';

        const auto parts = utils::split(prefix, '/');
        if (parts.size() != 3 || parts[0].empty() || parts[1].empty()) continue;

        const auto terms_it = rule.find("terms");
        if (terms_it == rule.end() || !terms_it->is_array()) continue;

        TermRule term_rule{std::move(prefix), {}};
        for (const auto& term : *terms_it) {
            if (term.is_string()) term_rule.terms.insert(term.get<std::string>());
        }

        bool replaced = false;
        for (auto& existing : filtered) {
            if (existing.prefix == term_rule.prefix) {
                existing = std::move(term_rule);
                replaced = true;
                break;
            }
        }
        if (!replaced) filtered.push_back(std::move(term_rule));
    }

    return filtered;
}

NormalizationResult SegmentNormalizer::normalize(std::string_view path) const {
    // Load current rules (RCU read)
    const auto rules = std::atomic_load_explicit(&rules_, std::memory_order_acquire);

    for (const auto& rule : *rules) {
        if (!path.starts_with(rule.prefix)) continue;

        const auto parts = utils::split(path.substr(rule.prefix.size()), '/');
        std::string value(rule.prefix);
        bool previous_placeholder = false;
        bool first = true;

        for (size_t i = 0; i < parts.size(); ++i) {
            const auto& part = parts[i];
            if (part.empty() && i + 1 == parts.size()) break;

            const bool keep = rule.terms.contains(part);
            if (!keep && previous_placeholder) continue;

            if (!first) value += '/';
            value += keep ? part : std::string("*");
            previous_placeholder = !keep;
            first = false;
        }

        utils::log::trace(std::format("Normalizing {} because of rule: {}", path, rule.prefix));
        return NormalizationResult{true, false, std::move(value)};
    }

    return NormalizationResult{false, false, std::string(path)};
}

size_t SegmentNormalizer::rule_count() const {
    return std::atomic_load_explicit(&rules_, std::memory_order_acquire)->size();
}

std::shared_ptr<const SegmentNormalizer::RuleList> SegmentNormalizer::rules() const {
    return std::atomic_load_explicit(&rules_, std::memory_order_acquire);
}

} // namespace apmcore
