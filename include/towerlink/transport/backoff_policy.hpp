#ifndef TOWERLINK_TRANSPORT_BACKOFF_POLICY_HPP
#define TOWERLINK_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>

namespace towerlink {

// ─────────────────────────────────────────────────────────────────────────────
// Reconnect Delay Formula
// ─────────────────────────────────────────────────────────────────────────────
// attempt is the number of consecutive failures so far.
//
//   attempt >= 10 : flat 5 minute cooldown
//   otherwise     : min(1000 * 2^attempt + floor(rand * 1000), 60000) ms
//
// The cap is applied after jitter, so attempt 6 (64s + jitter) still
// yields exactly 60s.

inline constexpr std::chrono::milliseconds kBackoffBase{1'000};
inline constexpr std::chrono::milliseconds kBackoffCap{60'000};
inline constexpr std::chrono::milliseconds kCooldownDelay{300'000};
inline constexpr std::size_t kCooldownThreshold = 10;

/// Uniform source in [0, 1).
using RandomSource = std::function<double()>;

[[nodiscard]] inline std::chrono::milliseconds calculate_backoff(
    std::size_t attempt,
    const RandomSource& rand
) {
    if (attempt >= kCooldownThreshold) {
        return kCooldownDelay;
    }

    const std::int64_t exponential = kBackoffBase.count() * (std::int64_t{1} << attempt);
    const double sample = std::clamp(rand(), 0.0, 0.999999);
    const auto jitter = static_cast<std::int64_t>(std::floor(sample * 1000.0));

    return std::chrono::milliseconds{std::min(exponential + jitter, kBackoffCap.count())};
}

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// The tunnel client asks its policy for the delay before every reconnect.
// Tests swap in NoBackoff / ConstantBackoff to keep the loop fast.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: consecutive failures recorded so far (1 after the first failure)
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ReconnectBackoff : public IBackoffPolicy {
public:
    ReconnectBackoff()
        : rng_(std::random_device{}())
    {
        rand_ = [this]() {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(rng_);
        };
    }

    explicit ReconnectBackoff(RandomSource rand)
        : rand_(std::move(rand))
    {}

    ReconnectBackoff(const ReconnectBackoff&) = delete;
    ReconnectBackoff& operator=(const ReconnectBackoff&) = delete;

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        return calculate_backoff(attempt, rand_);
    }

    void reset() override {}

private:
    std::mt19937 rng_;
    RandomSource rand_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff / ConstantBackoff - test helpers
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

}  // namespace towerlink

#endif  // TOWERLINK_TRANSPORT_BACKOFF_POLICY_HPP
