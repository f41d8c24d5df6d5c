#include "towerlink/security/path_filter.hpp"

#include <ada.h>

#include <algorithm>

namespace towerlink::security {

namespace detail {

namespace {

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Canonicalization Steps
// ═══════════════════════════════════════════════════════════════════════════

std::optional<std::string> percent_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (c != '%') {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= input.size()) {
            return std::nullopt;
        }
        const int high = hex_value(input[i + 1]);
        const int low = hex_value(input[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return out;
}

std::string collapse_slashes(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (const char c : path) {
        const bool repeated = (c == '/' && !out.empty() && out.back() == '/');
        if (repeated == false) {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> canonical_pathname(std::string_view decoded_path) {
    static const auto base = ada::parse<ada::url>("http://localhost");
    if (!base) {
        return std::nullopt;
    }

    const std::string collapsed = collapse_slashes(decoded_path);
    auto parsed = ada::parse<ada::url>(collapsed, &*base);
    if (!parsed) {
        return std::nullopt;
    }
    return std::string(parsed->get_pathname());
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

bool is_blocked_path(std::string_view path) {
    const auto decoded = detail::percent_decode(path);
    if (!decoded) {
        return path.starts_with(kBlockedPathPrefix);
    }

    const auto canonical = detail::canonical_pathname(*decoded);
    if (!canonical) {
        return detail::collapse_slashes(*decoded).starts_with(kBlockedPathPrefix);
    }
    return canonical->starts_with(kBlockedPathPrefix);
}

bool is_hop_by_hop_header(std::string_view name) noexcept {
    return std::ranges::any_of(kHopByHopHeaders, [name](std::string_view hop) {
        return http::iequals(hop, name);
    });
}

http::HeaderMap filter_hop_by_hop_headers(const http::RawHeaderMap& headers) {
    http::HeaderMap filtered;
    for (const auto& [name, value] : headers) {
        if (value.has_value() == false || is_hop_by_hop_header(name)) {
            continue;
        }
        filtered.emplace(name, *value);
    }
    return filtered;
}

http::HeaderMap filter_hop_by_hop_headers(const http::HeaderMap& headers) {
    http::HeaderMap filtered;
    for (const auto& [name, value] : headers) {
        if (is_hop_by_hop_header(name)) {
            continue;
        }
        filtered.emplace(name, value);
    }
    return filtered;
}

}  // namespace towerlink::security
