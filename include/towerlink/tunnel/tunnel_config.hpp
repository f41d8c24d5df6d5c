#ifndef TOWERLINK_TUNNEL_TUNNEL_CONFIG_HPP
#define TOWERLINK_TUNNEL_TUNNEL_CONFIG_HPP

#include "towerlink/tunnel/tunnel_error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace towerlink {

struct IBackoffPolicy;

// ─────────────────────────────────────────────────────────────────────────────
// TLS Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Applies to the relay connection unless use_plain_tcp is set. The local
// service is always spoken to in plaintext over loopback.

struct TlsConfig {
    // CA bundle for verifying the relay. Empty = system default store.
    std::string ca_cert_path;

    // WARNING: turning either of these off exposes the API key to any MITM.
    bool verify_peer{true};
    bool verify_hostname{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// Heartbeat
// ─────────────────────────────────────────────────────────────────────────────

struct HeartbeatConfig {
    std::chrono::milliseconds ping_interval{30'000};
    std::chrono::milliseconds pong_timeout{10'000};
};

// ─────────────────────────────────────────────────────────────────────────────
// Multiplexed Session
// ─────────────────────────────────────────────────────────────────────────────

struct MuxSessionConfig {
    // Larger frames are a protocol error and end the session.
    std::size_t max_frame_size{1024 * 1024};

    // Stream writers wait once this many encoded bytes are queued.
    std::size_t max_outbound_buffer{4 * 1024 * 1024};

    // A stream whose unread inbound data exceeds this is reset.
    std::size_t max_stream_inbox{8 * 1024 * 1024};

    std::size_t read_buffer_size{16 * 1024};
};

// ─────────────────────────────────────────────────────────────────────────────
// Tunnel Client Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Immutable once handed to a TunnelClient. Rotating credentials means
// building a new client.

struct TunnelClientConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Relay
    // ─────────────────────────────────────────────────────────────────────────

    std::string server_host;
    std::uint16_t tunnel_port{443};
    std::string api_key;
    std::string tower_id;

    // Plain TCP to the relay (tests, plaintext relays behind a terminator).
    bool use_plain_tcp{false};

    TlsConfig tls;

    // Connect + auth reply must complete within this.
    std::chrono::milliseconds handshake_timeout{15'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Local Service
    // ─────────────────────────────────────────────────────────────────────────

    std::string local_host{"127.0.0.1"};
    std::uint16_t local_port{4100};
    std::chrono::milliseconds local_connect_timeout{5'000};

    // Request bodies are buffered before forwarding; larger ones get 413.
    std::size_t max_request_body_size{10 * 1024 * 1024};

    // Upper bound on bytes read and discarded when the relay tore a stream
    // down while the local response was still arriving.
    std::size_t max_drain_bytes{1024 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Liveness / Retry
    // ─────────────────────────────────────────────────────────────────────────

    HeartbeatConfig heartbeat;
    MuxSessionConfig session;

    // Null = ReconnectBackoff (1s doubling, 60s cap, 5 min cooldown).
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    TunnelClientConfig& with_relay(std::string host, std::uint16_t port);
    TunnelClientConfig& with_credentials(std::string key, std::string tower);
    TunnelClientConfig& with_local_port(std::uint16_t port);
    TunnelClientConfig& with_plain_tcp(bool enabled = true);
    TunnelClientConfig& with_heartbeat(std::chrono::milliseconds interval, std::chrono::milliseconds timeout);
    TunnelClientConfig& with_handshake_timeout(std::chrono::milliseconds timeout);
    TunnelClientConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);

    /// Returns a description of the first problem, or std::nullopt if usable.
    [[nodiscard]] std::optional<std::string> validate() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Credential File
// ─────────────────────────────────────────────────────────────────────────────
// JSON document written by the device registration flow:
//
//   {
//     "server_url": "https://relay.example.com",
//     "tunnel_port": 443,
//     "api_key": "...",
//     "tower_id": "...",
//     "tower_name": "my-laptop",
//     "local_port": 4100,
//     "use_plain_tcp": false
//   }
//
// "server_host" may be given instead of (or to override) the host part of
// server_url.

struct TunnelCredentials {
    std::string server_url;
    std::string tower_name;
    TunnelClientConfig config;

    static TunnelResult<TunnelCredentials> from_json(const Json& j);
};

[[nodiscard]] TunnelResult<TunnelCredentials> load_credentials(const std::filesystem::path& path);

}  // namespace towerlink

#endif  // TOWERLINK_TUNNEL_TUNNEL_CONFIG_HPP
