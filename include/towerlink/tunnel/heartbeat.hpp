#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Heartbeat
// ═══════════════════════════════════════════════════════════════════════════
// Pings the relay every ping_interval and expects any pong within
// pong_timeout. A missed pong calls the timeout callback once and stops.
//
// Each start() is tied to a connection token. Before acting, both timers ask
// the liveness check whether that token is still current; a stale timer
// returns without pinging, rescheduling or reporting anything.

#include "towerlink/tunnel/tunnel_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace towerlink {

class Heartbeat {
public:
    using LivenessCheck = std::function<bool(std::uint64_t token)>;
    using PingFn        = std::function<bool(std::uint32_t nonce)>;
    using TimeoutFn     = std::function<void()>;

    Heartbeat(asio::any_io_executor executor, HeartbeatConfig config, LivenessCheck is_live = nullptr);
    ~Heartbeat();

    Heartbeat(const Heartbeat&) = delete;
    Heartbeat& operator=(const Heartbeat&) = delete;

    /// Restart for a new connection. Any previous run is stopped first.
    void start(std::uint64_t token, PingFn ping, TimeoutFn on_timeout);

    void stop();

    /// Any pong clears the outstanding deadline.
    void on_pong(std::uint32_t nonce);

    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] bool awaiting_pong() const noexcept { return awaiting_pong_; }
    [[nodiscard]] std::size_t pings_sent() const noexcept { return pings_sent_; }

private:
    void schedule_ping(std::uint64_t epoch);
    void on_ping_tick(std::uint64_t epoch);
    void arm_pong_timer(std::uint64_t epoch);
    void on_pong_deadline(std::uint64_t epoch, std::uint64_t pong_seq);
    [[nodiscard]] bool token_is_live() const;

    asio::steady_timer ping_timer_;
    asio::steady_timer pong_timer_;
    HeartbeatConfig config_;
    LivenessCheck is_live_;

    PingFn ping_;
    TimeoutFn on_timeout_;

    std::uint64_t token_{0};
    std::uint64_t epoch_{0};
    std::uint64_t pong_seq_{0};
    std::uint32_t next_nonce_{1};
    std::size_t pings_sent_{0};
    bool running_{false};
    bool awaiting_pong_{false};

    // Expires with the object; queued timer handlers check it first.
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace towerlink
