#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stream Proxy
// ═══════════════════════════════════════════════════════════════════════════
// Serves one relay stream against the local service. Requests are checked
// in this order:
//
//   1. blocked path (/api/tunnel/...)  → 403, never reaches the local service
//   2. GET /__tower/metadata           → 200 with the cached snapshot
//   3. CONNECT + :protocol websocket   → upgrade and pipe bytes both ways
//   4. anything else                   → HTTP/1.1 request to the local service
//
// Hop-by-hop headers are stripped in both directions. Local failures before
// a response head was sent become a 502; after that, a stream reset.

#include "towerlink/http/http_response_parser.hpp"
#include "towerlink/http/http_types.hpp"
#include "towerlink/mux/mux_stream.hpp"
#include "towerlink/transport/byte_stream.hpp"
#include "towerlink/tunnel/metadata.hpp"
#include "towerlink/tunnel/tunnel_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace towerlink {

inline constexpr std::string_view kForbiddenMessage = "Forbidden: tunnel management endpoints are local-only";
inline constexpr std::string_view kBadGatewayMessage = "Bad Gateway: local server unavailable";
inline constexpr std::string_view kPayloadTooLargeMessage = "Payload Too Large";

struct StreamProxyConfig {
    std::string local_host{"127.0.0.1"};
    std::uint16_t local_port{4100};
    std::chrono::milliseconds connect_timeout{5'000};
    std::size_t max_request_body_size{10 * 1024 * 1024};
    std::size_t max_drain_bytes{1024 * 1024};

    static StreamProxyConfig from(const TunnelClientConfig& config);
};

class StreamProxy : public std::enable_shared_from_this<StreamProxy> {
public:
    StreamProxy(
        asio::any_io_executor executor,
        StreamProxyConfig config,
        std::shared_ptr<MetadataCache> metadata
    );

    StreamProxy(const StreamProxy&) = delete;
    StreamProxy& operator=(const StreamProxy&) = delete;

    /// Serve the stream to completion. Never throws; unexpected errors reset
    /// the stream.
    asio::awaitable<void> handle(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head);

    /// Spawn handle() detached on the proxy's executor.
    void spawn(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head);

    [[nodiscard]] const StreamProxyConfig& config() const noexcept { return config_; }

private:
    asio::awaitable<void> serve(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head);
    asio::awaitable<void> forward_http(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head);
    asio::awaitable<void> forward_websocket(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head);

    // Read the local response through `parser` and mirror it onto the stream.
    asio::awaitable<void> relay_response(
        mux::MuxStream& stream,
        transport::TcpByteStream& local,
        http::HttpResponseParser& parser
    );

    asio::awaitable<void> pipe_local_to_relay(
        std::shared_ptr<mux::MuxStream> stream,
        std::shared_ptr<transport::TcpByteStream> local
    );
    asio::awaitable<void> pipe_relay_to_local(
        std::shared_ptr<mux::MuxStream> stream,
        std::shared_ptr<transport::TcpByteStream> local
    );

    // Read and discard what the local service is still sending.
    asio::awaitable<void> drain(transport::TcpByteStream& local);

    asio::awaitable<std::shared_ptr<transport::TcpByteStream>> connect_local();

    asio::any_io_executor executor_;
    StreamProxyConfig config_;
    std::shared_ptr<MetadataCache> metadata_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Helpers (exposed for testing)
// ─────────────────────────────────────────────────────────────────────────────

namespace detail {

/// Path without its query string.
[[nodiscard]] std::string_view path_only(std::string_view path) noexcept;

/// Request line, forwarded headers, Host, Content-Length and Connection: close.
[[nodiscard]] std::string build_local_request(
    const http::RequestHead& head,
    std::string_view host_header,
    std::string_view body
);

/// GET upgrade request for a relayed WebSocket CONNECT.
[[nodiscard]] std::string build_websocket_request(
    const http::RequestHead& head,
    std::string_view host_header,
    std::string_view websocket_key
);

/// 16 random bytes, base64 encoded.
[[nodiscard]] std::string make_websocket_key();

}  // namespace detail

}  // namespace towerlink
