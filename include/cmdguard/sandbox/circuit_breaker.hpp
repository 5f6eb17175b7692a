#pragma once

#include "cmdguard/policy/policy.hpp"

namespace cmdguard::sandbox {

struct CircuitBreakerState {
    int consecutive_blocked = 0;
    bool tripped = false;
};

/// Counts consecutive BLOCKED classifications and forces every further
/// classification to BLOCKED once the count exceeds the threshold.
///
/// Owned by a single enforcer instance and not synchronised; callers that
/// share an enforcer across threads must serialise classify() themselves.
class CircuitBreaker {
public:
    explicit CircuitBreaker(policy::CircuitBreakerConfig config = {})
        : config_(config) {}

    /// Record a rule-driven block. Returns true when this block trips the
    /// breaker (Closed -> Open); false otherwise, including while open.
    auto record_block() -> bool;

    /// Record a SAFE classification: resets the count and closes.
    void record_safe() noexcept { consecutive_blocked_ = 0; }

    /// Open iff enabled and the count exceeds the threshold.
    [[nodiscard]] auto is_open() const noexcept -> bool {
        return config_.enabled && consecutive_blocked_ > config_.threshold;
    }

    [[nodiscard]] auto consecutive_blocked() const noexcept -> int { return consecutive_blocked_; }
    [[nodiscard]] auto threshold() const noexcept -> int { return config_.threshold; }
    [[nodiscard]] auto enabled() const noexcept -> bool { return config_.enabled; }

    [[nodiscard]] auto state() const noexcept -> CircuitBreakerState {
        return {consecutive_blocked_, is_open()};
    }

private:
    policy::CircuitBreakerConfig config_;
    int consecutive_blocked_ = 0;
};

} // namespace cmdguard::sandbox
