#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Reconnect Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Decides whether the tunnel may reconnect on its own and how long to wait.
//
//   ┌─────────┐  cooldown_threshold   ┌──────────┐
//   │ CLOSED  │ ─────────────────────▶│ COOLDOWN │  (flat 5 min delay)
//   └────┬────┘  consecutive failures └────┬─────┘
//        │◀────────────────────────────────┤ record_success / reset
//        │                                 │
//        │ trip() (API key rejected)       │ trip()
//        ▼                                 ▼
//   ┌─────────┐
//   │ TRIPPED │  no automatic reconnects until reset()
//   └─────────┘
//
// Confined to the tunnel's event loop, so it carries no locking.

#include "towerlink/transport/backoff_policy.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace towerlink {

enum class BreakerState {
    Closed,    ///< Retrying with exponential backoff
    Cooldown,  ///< Too many consecutive failures, long flat delay
    Tripped    ///< Terminal rejection, waits for reset()
};

[[nodiscard]] constexpr std::string_view to_string(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::Closed:   return "Closed";
        case BreakerState::Cooldown: return "Cooldown";
        case BreakerState::Tripped:  return "Tripped";
    }
    return "Unknown";
}

struct ReconnectBreakerStats {
    std::size_t total_failures{0};
    std::size_t total_successes{0};
    std::size_t trips{0};
    BreakerState current_state{BreakerState::Closed};
};

class ReconnectBreaker {
public:
    using StateChangeCallback = std::function<void(BreakerState old_state, BreakerState new_state)>;

    /// A null policy selects ReconnectBackoff.
    explicit ReconnectBreaker(
        std::shared_ptr<IBackoffPolicy> policy = nullptr,
        std::size_t cooldown_threshold = kCooldownThreshold
    );

    ReconnectBreaker(const ReconnectBreaker&) = delete;
    ReconnectBreaker& operator=(const ReconnectBreaker&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Core Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Count one failed or dropped connection. Returns the new count.
    std::size_t record_failure();

    /// A connection reached the authenticated state.
    void record_success();

    /// Terminal rejection; blocks automatic reconnects.
    void trip();

    /// Zero the failure count and leave Tripped / Cooldown.
    void reset();

    /// Delay before the next reconnect, from the current failure count.
    [[nodiscard]] std::chrono::milliseconds next_delay();

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] BreakerState state() const noexcept { return state_; }
    [[nodiscard]] bool allows_reconnect() const noexcept { return state_ != BreakerState::Tripped; }
    [[nodiscard]] bool in_cooldown() const noexcept { return state_ == BreakerState::Cooldown; }
    [[nodiscard]] std::size_t consecutive_failures() const noexcept { return consecutive_failures_; }
    [[nodiscard]] ReconnectBreakerStats stats() const noexcept;

    void on_state_change(StateChangeCallback callback);

private:
    void transition(BreakerState next);

    std::shared_ptr<IBackoffPolicy> policy_;
    std::size_t cooldown_threshold_;
    BreakerState state_{BreakerState::Closed};
    std::size_t consecutive_failures_{0};

    std::size_t total_failures_{0};
    std::size_t total_successes_{0};
    std::size_t trips_{0};

    std::vector<StateChangeCallback> callbacks_;
};

}  // namespace towerlink
