#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace towerlink::http {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Header Containers
// ─────────────────────────────────────────────────────────────────────────────
// Headers arrive from the relay as a JSON object whose values are a string,
// an array of strings (set-cookie and friends) or null. A null value is kept
// as std::nullopt in RawHeaderMap until the hop-by-hop filter drops it.

using HeaderValue  = std::variant<std::string, std::vector<std::string>>;
using RawHeaderMap = std::map<std::string, std::optional<HeaderValue>>;
using HeaderMap    = std::map<std::string, HeaderValue>;

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;
[[nodiscard]] std::string to_lower(std::string_view text);

/// Case-insensitive lookup. Returns nullptr when absent.
[[nodiscard]] const HeaderValue* find_header(const HeaderMap& headers, std::string_view name);

/// First value of a header (case-insensitive), if present.
[[nodiscard]] std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name);

/// Add a header parsed off the wire. set-cookie accumulates into a list,
/// other repeats are joined with ", ".
void append_header(HeaderMap& headers, std::string_view name, std::string_view value);

[[nodiscard]] Json headers_to_json(const HeaderMap& headers);
[[nodiscard]] RawHeaderMap raw_headers_from_json(const Json& j);

// ─────────────────────────────────────────────────────────────────────────────
// Syntax Checks
// ─────────────────────────────────────────────────────────────────────────────
// Everything in a relayed head ends up in a request line or header line on
// the local socket, so none of it may carry CR, LF or other control bytes.

/// RFC 7230 token (method, header name).
[[nodiscard]] bool is_token(std::string_view text) noexcept;

/// Request target or authority: no whitespace, no control bytes.
[[nodiscard]] bool is_valid_request_target(std::string_view text) noexcept;

/// Header field value: visible characters, spaces and tabs only.
[[nodiscard]] bool is_valid_header_value(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Request / Response Heads
// ─────────────────────────────────────────────────────────────────────────────

/// Head of a stream opened by the relay.
struct RequestHead {
    std::string method;
    std::string path;
    RawHeaderMap headers;
    std::optional<std::string> protocol;   // "websocket" for extended CONNECT
    std::optional<std::string> authority;

    [[nodiscard]] bool is_websocket_connect() const noexcept {
        return method == "CONNECT" && protocol.has_value() && *protocol == "websocket";
    }

    [[nodiscard]] Json to_json() const;

    /// Describes the first field that cannot be written to an HTTP/1.1
    /// request as-is, or std::nullopt when the head is well-formed.
    [[nodiscard]] std::optional<std::string> validate() const;

    /// Returns std::nullopt when method or path is missing or mistyped, or
    /// when validate() finds a problem.
    static std::optional<RequestHead> from_json(const Json& j);
};

/// Head sent back to the relay on a stream.
struct ResponseHead {
    int status{200};
    HeaderMap headers;

    [[nodiscard]] Json to_json() const;
    static std::optional<ResponseHead> from_json(const Json& j);
};

}  // namespace towerlink::http
