#include "propagation/outbound_headers.hpp"

#include <algorithm>
#include <cctype>

namespace apmcore {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

} // anonymous namespace

void OutboundHeaders::set(std::string name, std::string value) {
    for (auto& [key, existing] : entries_) {
        if (key == name) {
            existing = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

const std::string* OutboundHeaders::find(std::string_view name) const {
    for (const auto& [key, value] : entries_) {
        if (key == name) return &value;
    }
    return nullptr;
}

HeaderCarrier OutboundHeaders::merge_into(const HeaderCarrier& original) const {
    if (const auto* list = std::get_if<HeaderList>(&original)) {
        HeaderList merged = *list;
        merged.insert(merged.end(), entries_.begin(), entries_.end());
        return merged;
    }

    HeaderMap merged = std::get<HeaderMap>(original);
    for (const auto& [key, value] : entries_) {
        merged.insert_or_assign(key, value);
    }
    return merged;
}

const std::string* find_header(const HeaderMap& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

const std::string* find_header(const HeaderCarrier& headers, std::string_view name) {
    if (const auto* map = std::get_if<HeaderMap>(&headers)) {
        return find_header(*map, name);
    }
    for (const auto& [key, value] : std::get<HeaderList>(headers)) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

} // namespace apmcore
