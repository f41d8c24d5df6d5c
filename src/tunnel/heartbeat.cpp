#include "towerlink/tunnel/heartbeat.hpp"
#include "towerlink/log/logger.hpp"

#include <exception>

namespace towerlink {

Heartbeat::Heartbeat(asio::any_io_executor executor, HeartbeatConfig config, LivenessCheck is_live)
    : ping_timer_(executor)
    , pong_timer_(executor)
    , config_(config)
    , is_live_(std::move(is_live))
{}

Heartbeat::~Heartbeat() {
    alive_.reset();
    stop();
}

void Heartbeat::start(std::uint64_t token, PingFn ping, TimeoutFn on_timeout) {
    stop();

    token_ = token;
    ping_ = std::move(ping);
    on_timeout_ = std::move(on_timeout);
    running_ = true;
    schedule_ping(epoch_);
}

void Heartbeat::stop() {
    running_ = false;
    awaiting_pong_ = false;
    ++epoch_;
    ++pong_seq_;
    ping_timer_.cancel();
    pong_timer_.cancel();
    ping_ = nullptr;
    on_timeout_ = nullptr;
}

void Heartbeat::on_pong(std::uint32_t nonce) {
    if (running_ == false) {
        return;
    }
    TOWERLINK_LOG_TRACE("pong {} received", nonce);
    awaiting_pong_ = false;
    ++pong_seq_;
    pong_timer_.cancel();
}

bool Heartbeat::token_is_live() const {
    return !is_live_ || is_live_(token_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Ping Schedule
// ─────────────────────────────────────────────────────────────────────────────

void Heartbeat::schedule_ping(std::uint64_t epoch) {
    ping_timer_.expires_after(config_.ping_interval);
    ping_timer_.async_wait([this, alive = std::weak_ptr<bool>(alive_), epoch](const asio::error_code& ec) {
        if (alive.expired() || ec) {
            return;
        }
        on_ping_tick(epoch);
    });
}

void Heartbeat::on_ping_tick(std::uint64_t epoch) {
    if (running_ == false || epoch != epoch_) {
        return;
    }
    if (token_is_live() == false) {
        return;  // connection replaced; do not reschedule
    }

    if (awaiting_pong_ == false && ping_) {
        const std::uint32_t nonce = next_nonce_++;
        auto ping = ping_;
        bool sent = false;
        try {
            sent = ping(nonce);
        } catch (const std::exception& e) {
            TOWERLINK_LOG_DEBUG("heartbeat ping threw: {}", e.what());
        } catch (...) {
            TOWERLINK_LOG_DEBUG("heartbeat ping threw a non-standard exception");
        }

        if (epoch != epoch_) {
            return;  // stopped from inside the ping callback
        }

        // A failed send still arms the deadline.
        awaiting_pong_ = true;
        arm_pong_timer(epoch);
        if (sent) {
            ++pings_sent_;
        } else {
            TOWERLINK_LOG_DEBUG("heartbeat ping {} not sent", nonce);
        }
    }

    schedule_ping(epoch);
}

// ─────────────────────────────────────────────────────────────────────────────
// Pong Deadline
// ─────────────────────────────────────────────────────────────────────────────

void Heartbeat::arm_pong_timer(std::uint64_t epoch) {
    const std::uint64_t pong_seq = ++pong_seq_;
    pong_timer_.expires_after(config_.pong_timeout);
    pong_timer_.async_wait(
        [this, alive = std::weak_ptr<bool>(alive_), epoch, pong_seq](const asio::error_code& ec) {
            if (alive.expired() || ec) {
                return;
            }
            on_pong_deadline(epoch, pong_seq);
        });
}

void Heartbeat::on_pong_deadline(std::uint64_t epoch, std::uint64_t pong_seq) {
    if (running_ == false || epoch != epoch_ || pong_seq != pong_seq_ || awaiting_pong_ == false) {
        return;
    }
    if (token_is_live() == false) {
        return;
    }

    TOWERLINK_LOG_WARN("no pong from relay within {} ms", config_.pong_timeout.count());
    auto on_timeout = std::move(on_timeout_);
    stop();
    if (on_timeout) {
        on_timeout();
    }
}

}  // namespace towerlink
