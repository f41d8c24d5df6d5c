#include "towerlink/resilience/reconnect_breaker.hpp"

namespace towerlink {

ReconnectBreaker::ReconnectBreaker(
    std::shared_ptr<IBackoffPolicy> policy,
    std::size_t cooldown_threshold
)
    : policy_(std::move(policy))
    , cooldown_threshold_(cooldown_threshold)
{
    if (policy_ == nullptr) {
        policy_ = std::make_shared<ReconnectBackoff>();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────

std::size_t ReconnectBreaker::record_failure() {
    ++total_failures_;
    ++consecutive_failures_;

    const bool reached_cooldown = (consecutive_failures_ >= cooldown_threshold_);
    if (state_ == BreakerState::Closed && reached_cooldown) {
        transition(BreakerState::Cooldown);
    }
    return consecutive_failures_;
}

void ReconnectBreaker::record_success() {
    ++total_successes_;
    consecutive_failures_ = 0;
    policy_->reset();

    if (state_ == BreakerState::Cooldown) {
        transition(BreakerState::Closed);
    }
}

void ReconnectBreaker::trip() {
    if (state_ == BreakerState::Tripped) {
        return;
    }
    ++trips_;
    transition(BreakerState::Tripped);
}

void ReconnectBreaker::reset() {
    consecutive_failures_ = 0;
    policy_->reset();
    transition(BreakerState::Closed);
}

std::chrono::milliseconds ReconnectBreaker::next_delay() {
    return policy_->next_delay(consecutive_failures_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries / Callbacks
// ─────────────────────────────────────────────────────────────────────────────

ReconnectBreakerStats ReconnectBreaker::stats() const noexcept {
    return ReconnectBreakerStats{
        .total_failures = total_failures_,
        .total_successes = total_successes_,
        .trips = trips_,
        .current_state = state_
    };
}

void ReconnectBreaker::on_state_change(StateChangeCallback callback) {
    callbacks_.push_back(std::move(callback));
}

void ReconnectBreaker::transition(BreakerState next) {
    if (next == state_) {
        return;
    }
    const BreakerState previous = state_;
    state_ = next;

    // Copy so a callback may register further callbacks.
    const auto callbacks = callbacks_;
    for (const auto& callback : callbacks) {
        callback(previous, next);
    }
}

}  // namespace towerlink
