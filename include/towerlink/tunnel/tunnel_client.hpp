#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tunnel Client
// ═══════════════════════════════════════════════════════════════════════════
// Keeps one outbound connection to the relay alive and serves the streams
// the relay opens on it.
//
//                 connect()
//   DISCONNECTED ───────────▶ CONNECTING ──auth_ok──▶ CONNECTED
//        ▲                       │   │                   │
//        │    retryable failure  │   │ invalid_api_key   │ drop / pong timeout
//        ├───────────────────────┘   ▼                   │
//        │                      AUTH_FAILED              │
//        │  reset_circuit_breaker()  │                   │
//        ├───────────────────────────┘                   │
//        └───────────────────────────────────────────────┘
//              (backoff timer calls connect again)
//
// Everything runs on the executor passed in; none of the methods may be
// called from another thread. connect() returns immediately; progress is
// visible through state() and on_state_change().

#include "towerlink/mux/mux_session.hpp"
#include "towerlink/resilience/reconnect_breaker.hpp"
#include "towerlink/transport/byte_stream.hpp"
#include "towerlink/tunnel/handshake.hpp"
#include "towerlink/tunnel/heartbeat.hpp"
#include "towerlink/tunnel/metadata.hpp"
#include "towerlink/tunnel/stream_proxy.hpp"
#include "towerlink/tunnel/tunnel_config.hpp"
#include "towerlink/tunnel/tunnel_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace towerlink {

enum class TunnelState {
    Disconnected,
    Connecting,
    Connected,
    AuthFailed
};

[[nodiscard]] constexpr std::string_view to_string(TunnelState state) noexcept {
    switch (state) {
        case TunnelState::Disconnected: return "disconnected";
        case TunnelState::Connecting:   return "connecting";
        case TunnelState::Connected:    return "connected";
        case TunnelState::AuthFailed:   return "auth_failed";
    }
    return "unknown";
}

class TunnelClient {
public:
    using StateListener = std::function<void(TunnelState state, TunnelState previous)>;

    TunnelClient(asio::any_io_executor executor, TunnelClientConfig config);
    ~TunnelClient();

    TunnelClient(const TunnelClient&) = delete;
    TunnelClient& operator=(const TunnelClient&) = delete;
    TunnelClient(TunnelClient&&) = delete;
    TunnelClient& operator=(TunnelClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start connecting. No-op while connecting or connected, and while in
    /// AuthFailed (see reset_circuit_breaker()).
    void connect();

    /// Tear down the connection or attempt in flight and cancel any pending
    /// reconnect. Idempotent.
    ///
    /// AuthFailed is left as is: the rejected key stays visible to the owner
    /// and only reset_circuit_breaker() leaves that state.
    void disconnect();

    /// Zero the failure count. Moves AuthFailed to Disconnected.
    void reset_circuit_breaker();

    // ─────────────────────────────────────────────────────────────────────────
    // Metadata
    // ─────────────────────────────────────────────────────────────────────────

    /// Replace the snapshot served on /__tower/metadata; pushed to the relay
    /// as well while connected.
    void send_metadata(TowerMetadata metadata);

    // ─────────────────────────────────────────────────────────────────────────
    // Observation
    // ─────────────────────────────────────────────────────────────────────────

    /// Listeners run synchronously inside the transition. Exceptions they
    /// throw are logged and dropped.
    void on_state_change(StateListener listener);

    [[nodiscard]] TunnelState state() const noexcept { return state_; }

    /// Time since entering Connected; std::nullopt in any other state.
    [[nodiscard]] std::optional<std::chrono::milliseconds> uptime() const;

    [[nodiscard]] std::size_t consecutive_failures() const noexcept { return breaker_.consecutive_failures(); }
    [[nodiscard]] BreakerState breaker_state() const noexcept { return breaker_.state(); }

    /// Tower id from the last auth_ok, or the configured one.
    [[nodiscard]] const std::string& confirmed_tower_id() const noexcept;

    [[nodiscard]] std::size_t active_stream_count() const noexcept;

    [[nodiscard]] const TunnelClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<MetadataCache>& metadata() const noexcept { return metadata_; }

private:
    void start_attempt();

    asio::awaitable<void> establish(
        std::uint64_t generation,
        std::shared_ptr<transport::IByteStream> stream,
        std::weak_ptr<bool> lifetime
    );

    void on_authenticated(
        std::uint64_t generation,
        std::shared_ptr<transport::IByteStream> stream,
        HandshakeOutcome outcome
    );

    void handle_failure(std::uint64_t generation, const TunnelError& error);
    void schedule_reconnect();
    void cancel_reconnect();

    // Drop the session or pending attempt and invalidate its token.
    void release_connection();

    void set_state(TunnelState next);

    [[nodiscard]] bool is_current(std::uint64_t generation) const noexcept {
        return generation == generation_;
    }

    asio::any_io_executor executor_;
    TunnelClientConfig config_;

    TunnelState state_{TunnelState::Disconnected};
    std::vector<StateListener> listeners_;

    // Connection token: bumped whenever the live connection is replaced or
    // dropped. Callbacks carry the value they were created under.
    std::uint64_t generation_{0};
    std::uint64_t reconnect_epoch_{0};

    // Asynchronous callbacks hold a weak_ptr to this and bail once it expires.
    std::shared_ptr<bool> lifetime_{std::make_shared<bool>(true)};

    std::shared_ptr<transport::IByteStream> pending_stream_;
    std::shared_ptr<mux::MuxSession> session_;
    std::optional<std::chrono::steady_clock::time_point> connected_at_;
    std::string confirmed_tower_id_;

    std::shared_ptr<MetadataCache> metadata_;
    std::shared_ptr<StreamProxy> proxy_;

    ReconnectBreaker breaker_;
    Heartbeat heartbeat_;
    asio::steady_timer reconnect_timer_;
};

}  // namespace towerlink
