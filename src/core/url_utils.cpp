#include "core/url_utils.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace apmcore::url {

namespace {

struct UrlParts {
    std::string_view protocol;
    std::string_view pathname;  // empty when the URL has none
    std::string_view query;     // without the leading '?'
};

UrlParts split_url(std::string_view url) {
    UrlParts parts;

    // Fragment never reaches the server
    if (const auto hash = url.find('#'); hash != std::string_view::npos) {
        url = url.substr(0, hash);
    }

    if (const auto q = url.find('?'); q != std::string_view::npos) {
        parts.query = url.substr(q + 1);
        url = url.substr(0, q);
    }

    // scheme "://" authority
    if (const auto scheme_end = url.find("://"); scheme_end != std::string_view::npos) {
        const auto scheme = url.substr(0, scheme_end);
        const bool valid_scheme = !scheme.empty() &&
            std::all_of(scheme.begin(), scheme.end(), [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
            });
        if (valid_scheme) {
            parts.protocol = url.substr(0, scheme_end + 1);
            url = url.substr(scheme_end + 3);
            const auto slash = url.find('/');
            url = (slash == std::string_view::npos) ? std::string_view{} : url.substr(slash);
        }
    }

    parts.pathname = url;
    return parts;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string decode_component(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

AttributeMap parse_query(std::string_view query) {
    AttributeMap params;
    if (query.empty()) return params;

    for (const auto& pair : utils::split(query, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[decode_component(pair)] = true;
        } else {
            const auto key = decode_component(std::string_view(pair).substr(0, eq));
            if (key.empty()) continue;
            params[key] = decode_component(std::string_view(pair).substr(eq + 1));
        }
    }
    return params;
}

std::string scrub_pathname(std::string_view pathname) {
    if (pathname.empty() || pathname.front() != '/') {
        return "/";
    }
    if (const auto semi = pathname.find(';'); semi != std::string_view::npos) {
        pathname = pathname.substr(0, semi);
    }
    if (pathname.size() > 1 && pathname.back() == '/') {
        pathname.remove_suffix(1);
    }
    return std::string(pathname);
}

std::optional<int> parse_status(std::string_view status_code) {
    return utils::parse_int_strict<int>(status_code);
}

} // anonymous namespace

std::string scrub(std::string_view url) {
    return scrub_pathname(split_url(url).pathname);
}

AttributeMap parse_parameters(std::string_view url) {
    return parse_query(split_url(url).query);
}

ParsedUrl scrub_and_parse_parameters(std::string_view url) {
    const auto parts = split_url(url);
    ParsedUrl parsed;
    parsed.protocol = std::string(parts.protocol);
    parsed.path = scrub_pathname(parts.pathname);
    parsed.parameters = parse_query(parts.query);
    return parsed;
}

bool is_ignored_error(const ErrorCollectorConfig* config, int status_code) {
    if (status_code < 400 || !config) return false;
    const auto& ignored = config->ignore_status_codes;
    return std::find(ignored.begin(), ignored.end(), status_code) != ignored.end();
}

bool is_ignored_error(const ErrorCollectorConfig* config, std::string_view status_code) {
    const auto code = parse_status(status_code);
    return code && is_ignored_error(config, *code);
}

bool is_error(const ErrorCollectorConfig* config, int status_code) {
    return status_code >= 400 && !is_ignored_error(config, status_code);
}

bool is_error(const ErrorCollectorConfig* config, std::string_view status_code) {
    const auto code = parse_status(status_code);
    return code && is_error(config, *code);
}

void copy_parameters(const AttributeMap& source, AttributeMap& dest) {
    for (const auto& [key, value] : source) {
        dest.try_emplace(key, value);
    }
}

} // namespace apmcore::url
