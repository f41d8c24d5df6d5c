#ifndef TOWERLINK_SECURITY_PATH_FILTER_HPP
#define TOWERLINK_SECURITY_PATH_FILTER_HPP

#include "towerlink/http/http_types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace towerlink::security {

// ═══════════════════════════════════════════════════════════════════════════
// Reserved Paths
// ═══════════════════════════════════════════════════════════════════════════
// Requests under the control-plane prefix manage the tunnel itself and must
// only ever be reachable from the local machine. The metadata path is
// answered by the tunnel from its own cache.

inline constexpr std::string_view kBlockedPathPrefix = "/api/tunnel/";
inline constexpr std::string_view kMetadataPath = "/__tower/metadata";

// ═══════════════════════════════════════════════════════════════════════════
// Blocked Path Check
// ═══════════════════════════════════════════════════════════════════════════
// The path is canonicalized before the prefix comparison:
//   1. percent-decode (so "/api%2Ftunnel/x" cannot slip through)
//   2. collapse repeated slashes (so "//api/tunnel" is not read as a host)
//   3. resolve "." / ".." with the WHATWG URL parser against http://localhost
//
// Malformed percent-encoding fails closed: the raw path is prefix-checked
// instead of being let through.

[[nodiscard]] bool is_blocked_path(std::string_view path);

// ═══════════════════════════════════════════════════════════════════════════
// Hop-by-Hop Headers
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr std::array<std::string_view, 8> kHopByHopHeaders = {
    "connection",
    "keep-alive",
    "proxy-authenticate",
    "proxy-authorization",
    "te",
    "trailers",
    "transfer-encoding",
    "upgrade"
};

[[nodiscard]] bool is_hop_by_hop_header(std::string_view name) noexcept;

/// Copy without hop-by-hop names (case-insensitive). Entries without a value
/// are dropped; multi-valued entries pass through unchanged.
[[nodiscard]] http::HeaderMap filter_hop_by_hop_headers(const http::RawHeaderMap& headers);

/// Same filter for headers that are already known to carry values.
[[nodiscard]] http::HeaderMap filter_hop_by_hop_headers(const http::HeaderMap& headers);

// ═══════════════════════════════════════════════════════════════════════════
// Internal Helpers (exposed for testing)
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

// std::nullopt on a truncated or non-hex escape
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view input);

[[nodiscard]] std::string collapse_slashes(std::string_view path);

// Pathname after dot-segment resolution, std::nullopt if the URL parser rejects it
[[nodiscard]] std::optional<std::string> canonical_pathname(std::string_view decoded_path);

}  // namespace detail

}  // namespace towerlink::security

#endif  // TOWERLINK_SECURITY_PATH_FILTER_HPP
