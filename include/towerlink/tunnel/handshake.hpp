#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Relay Handshake
// ═══════════════════════════════════════════════════════════════════════════
// First exchange on a fresh relay connection, one JSON object per line:
//
//   tower → relay   {"type":"auth","apiKey":"...","towerId":"..."}
//   relay → tower   {"type":"auth_ok","towerId":"..."}
//               or  {"type":"auth_error","reason":"invalid_api_key"}
//
// Anything the relay sends after the newline already belongs to the framed
// session and is handed back as `leftover`.

#include "towerlink/transport/byte_stream.hpp"
#include "towerlink/tunnel/tunnel_error.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace towerlink {

inline constexpr std::size_t kMaxAuthReplySize = 64 * 1024;

struct AuthOk {
    // Tower id the relay bound this connection to. May be empty.
    std::string tower_id;
};

struct HandshakeOutcome {
    AuthOk ack;
    std::string leftover;
};

/// The auth line, newline included.
[[nodiscard]] std::string make_auth_frame(std::string_view api_key, std::string_view tower_id);

/// Parse one reply line (without the newline).
[[nodiscard]] TunnelResult<AuthOk> parse_auth_reply(std::string_view line);

/// Send the auth line and read the reply. No deadline of its own; the caller
/// closes the stream to abandon it.
asio::awaitable<TunnelResult<HandshakeOutcome>> perform_handshake(
    transport::IByteStream& stream,
    std::string api_key,
    std::string tower_id
);

}  // namespace towerlink
