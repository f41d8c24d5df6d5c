#include "towerlink/tunnel/tunnel_client.hpp"
#include "towerlink/log/logger.hpp"
#include "towerlink/transport/deadline.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

#include <exception>
#include <system_error>

namespace towerlink {

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

TunnelClient::TunnelClient(asio::any_io_executor executor, TunnelClientConfig config)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , confirmed_tower_id_(config_.tower_id)
    , metadata_(std::make_shared<MetadataCache>())
    , proxy_(std::make_shared<StreamProxy>(executor_, StreamProxyConfig::from(config_), metadata_))
    , breaker_(config_.backoff_policy)
    , heartbeat_(executor_, config_.heartbeat, [this](std::uint64_t token) {
        return is_current(token) && state_ == TunnelState::Connected;
    })
    , reconnect_timer_(executor_)
{}

TunnelClient::~TunnelClient() {
    // Silence everything first: no listener may observe a dying client.
    lifetime_.reset();
    listeners_.clear();
    cancel_reconnect();
    release_connection();
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void TunnelClient::connect() {
    if (state_ == TunnelState::Connecting || state_ == TunnelState::Connected) {
        return;
    }
    if (state_ == TunnelState::AuthFailed) {
        TOWERLINK_LOG_WARN("connect ignored: API key was rejected, reset the circuit breaker first");
        return;
    }

    cancel_reconnect();
    start_attempt();
}

void TunnelClient::disconnect() {
    cancel_reconnect();
    release_connection();

    if (state_ == TunnelState::AuthFailed) {
        return;
    }
    set_state(TunnelState::Disconnected);
}

void TunnelClient::reset_circuit_breaker() {
    breaker_.reset();
    if (state_ == TunnelState::AuthFailed) {
        set_state(TunnelState::Disconnected);
    }
}

void TunnelClient::start_attempt() {
    const std::uint64_t generation = ++generation_;
    set_state(TunnelState::Connecting);
    if (is_current(generation) == false || state_ != TunnelState::Connecting) {
        return;  // a listener already moved on
    }

    if (auto problem = config_.validate()) {
        handle_failure(generation, TunnelError::invalid_config(*problem));
        return;
    }

    std::shared_ptr<transport::IByteStream> stream;
    try {
        stream = transport::make_relay_stream(executor_, config_);
    } catch (const std::system_error& e) {
        handle_failure(generation, TunnelError::tls_error(std::string("TLS setup failed: ") + e.what()));
        return;
    }
    pending_stream_ = stream;

    TOWERLINK_LOG_INFO("connecting to relay {}:{}{}",
                       config_.server_host, config_.tunnel_port, config_.use_plain_tcp ? " (plain tcp)" : "");

    asio::co_spawn(executor_, establish(generation, std::move(stream), lifetime_), asio::detached);
}

asio::awaitable<void> TunnelClient::establish(
    std::uint64_t generation,
    std::shared_ptr<transport::IByteStream> stream,
    std::weak_ptr<bool> lifetime
) {
    // co_spawn starts us from a posted handler; the client may already be gone.
    if (lifetime.expired() || is_current(generation) == false) {
        co_return;
    }

    // Copied up front: members may not be touched once `lifetime` expires.
    const std::string host = config_.server_host;
    const std::uint16_t port = config_.tunnel_port;
    const std::string api_key = config_.api_key;
    const std::string tower_id = config_.tower_id;

    transport::Deadline deadline(executor_, config_.handshake_timeout, [stream] { stream->close(); });

    auto connected = co_await stream->async_connect(host, port);
    if (lifetime.expired()) {
        co_return;
    }
    if (is_current(generation) == false) {
        stream->close();
        co_return;
    }
    if (!connected) {
        handle_failure(generation, deadline.expired()
            ? TunnelError::timeout("relay connect timed out")
            : connected.error());
        co_return;
    }

    auto outcome = co_await perform_handshake(*stream, api_key, tower_id);
    if (lifetime.expired()) {
        co_return;
    }
    if (is_current(generation) == false) {
        stream->close();
        co_return;
    }
    if (!outcome) {
        handle_failure(generation, deadline.expired()
            ? TunnelError::timeout("relay handshake timed out")
            : outcome.error());
        co_return;
    }

    deadline.cancel();
    on_authenticated(generation, std::move(stream), std::move(*outcome));
}

void TunnelClient::on_authenticated(
    std::uint64_t generation,
    std::shared_ptr<transport::IByteStream> stream,
    HandshakeOutcome outcome
) {
    pending_stream_.reset();
    confirmed_tower_id_ = outcome.ack.tower_id.empty() ? config_.tower_id : outcome.ack.tower_id;

    const std::weak_ptr<bool> lifetime = lifetime_;
    auto session = std::make_shared<mux::MuxSession>(executor_, std::move(stream), config_.session);

    session->set_stream_handler([proxy = proxy_](std::shared_ptr<mux::MuxStream> s, http::RequestHead head) {
        proxy->spawn(std::move(s), std::move(head));
    });
    session->set_pong_handler([this, lifetime, generation](std::uint32_t nonce) {
        if (lifetime.expired() || is_current(generation) == false) {
            return;
        }
        heartbeat_.on_pong(nonce);
    });
    session->set_close_handler([this, lifetime, generation](const TunnelError& error) {
        if (lifetime.expired()) {
            return;
        }
        handle_failure(generation, error);
    });

    session_ = session;
    session->start(std::move(outcome.leftover));

    breaker_.record_success();
    connected_at_ = std::chrono::steady_clock::now();
    TOWERLINK_LOG_INFO("tunnel connected as tower {}", confirmed_tower_id_);

    set_state(TunnelState::Connected);
    if (is_current(generation) == false || state_ != TunnelState::Connected) {
        return;
    }

    heartbeat_.start(
        generation,
        [weak_session = std::weak_ptr<mux::MuxSession>(session)](std::uint32_t nonce) {
            auto live = weak_session.lock();
            return live && live->send_ping(nonce);
        },
        [this, lifetime, generation] {
            if (lifetime.expired()) {
                return;
            }
            handle_failure(generation, TunnelError::heartbeat_timeout());
        });

    session->send_metadata(metadata_->to_json());
}

// ═══════════════════════════════════════════════════════════════════════════
// Failure / Reconnect
// ═══════════════════════════════════════════════════════════════════════════

void TunnelClient::handle_failure(std::uint64_t generation, const TunnelError& error) {
    if (is_current(generation) == false) {
        return;
    }
    release_connection();

    if (error.is_retryable() == false) {
        breaker_.trip();
        TOWERLINK_LOG_ERROR("relay rejected the API key for tower {}; re-authenticate this device", config_.tower_id);
        set_state(TunnelState::AuthFailed);
        return;
    }

    TOWERLINK_LOG_WARN("tunnel connection failed: {} ({})", error.message, to_string(error.code));
    breaker_.record_failure();
    set_state(TunnelState::Disconnected);
    if (state_ != TunnelState::Disconnected) {
        return;
    }
    schedule_reconnect();
}

void TunnelClient::schedule_reconnect() {
    if (breaker_.allows_reconnect() == false) {
        return;
    }

    const auto delay = breaker_.next_delay();
    const std::uint64_t epoch = ++reconnect_epoch_;
    TOWERLINK_LOG_INFO("reconnecting in {} ms after {} consecutive failures",
                       delay.count(), breaker_.consecutive_failures());

    // expires_after() cancels any wait still pending.
    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this, lifetime = std::weak_ptr<bool>(lifetime_), epoch](const asio::error_code& ec) {
        if (lifetime.expired() || ec || epoch != reconnect_epoch_) {
            return;
        }
        if (state_ != TunnelState::Disconnected || breaker_.allows_reconnect() == false) {
            return;
        }
        start_attempt();
    });
}

void TunnelClient::cancel_reconnect() {
    ++reconnect_epoch_;
    reconnect_timer_.cancel();
}

void TunnelClient::release_connection() {
    ++generation_;
    heartbeat_.stop();
    connected_at_.reset();

    if (session_) {
        auto session = std::move(session_);
        session_.reset();
        session->close();
    }
    if (pending_stream_) {
        auto stream = std::move(pending_stream_);
        pending_stream_.reset();
        stream->close();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Metadata / Observation
// ═══════════════════════════════════════════════════════════════════════════

void TunnelClient::send_metadata(TowerMetadata metadata) {
    metadata_->replace(std::move(metadata));
    if (state_ == TunnelState::Connected && session_) {
        session_->send_metadata(metadata_->to_json());
    }
}

void TunnelClient::on_state_change(StateListener listener) {
    listeners_.push_back(std::move(listener));
}

std::optional<std::chrono::milliseconds> TunnelClient::uptime() const {
    if (state_ != TunnelState::Connected || !connected_at_) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - *connected_at_
    );
}

const std::string& TunnelClient::confirmed_tower_id() const noexcept {
    return confirmed_tower_id_;
}

std::size_t TunnelClient::active_stream_count() const noexcept {
    return session_ ? session_->stream_count() : 0;
}

void TunnelClient::set_state(TunnelState next) {
    if (next == state_) {
        return;
    }
    const TunnelState previous = state_;
    state_ = next;
    TOWERLINK_LOG_INFO("tunnel state {} -> {}", to_string(previous), to_string(next));

    // Copy so a listener may register another without invalidating the loop.
    const auto listeners = listeners_;
    for (const auto& listener : listeners) {
        try {
            listener(next, previous);
        } catch (const std::exception& e) {
            TOWERLINK_LOG_WARN("state listener threw: {}", e.what());
        } catch (...) {
            TOWERLINK_LOG_WARN("state listener threw a non-standard exception");
        }
    }
}

}  // namespace towerlink
