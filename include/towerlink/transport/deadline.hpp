#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Deadline
// ═══════════════════════════════════════════════════════════════════════════
// One-shot timer that runs a callback if it is not cancelled in time. Used to
// bound connects and the auth exchange: the callback closes the socket, which
// fails the pending operation with operation_aborted.
//
// The handler only touches the shared state block, so a Deadline may be
// destroyed while its wait is still queued.

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace towerlink::transport {

class Deadline {
public:
    /// A zero timeout arms nothing; expired() then stays false.
    Deadline(
        asio::any_io_executor executor,
        std::chrono::milliseconds timeout,
        std::function<void()> on_expire
    )
        : timer_(std::move(executor))
        , state_(std::make_shared<State>())
    {
        state_->on_expire = std::move(on_expire);
        if (timeout.count() <= 0) {
            return;
        }
        timer_.expires_after(timeout);
        timer_.async_wait([state = state_](const asio::error_code& ec) {
            if (ec || state->cancelled) {
                return;  // cancelled or completed in time
            }
            state->expired = true;
            if (state->on_expire) {
                state->on_expire();
            }
        });
    }

    ~Deadline() { cancel(); }

    Deadline(const Deadline&) = delete;
    Deadline& operator=(const Deadline&) = delete;

    void cancel() noexcept {
        state_->cancelled = true;
        state_->on_expire = nullptr;
        timer_.cancel();
    }

    [[nodiscard]] bool expired() const noexcept { return state_->expired; }

private:
    struct State {
        bool expired{false};
        bool cancelled{false};
        std::function<void()> on_expire;
    };

    asio::steady_timer timer_;
    std::shared_ptr<State> state_;
};

}  // namespace towerlink::transport
