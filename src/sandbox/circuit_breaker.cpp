#include "cmdguard/sandbox/circuit_breaker.hpp"

#include "cmdguard/core/logger.hpp"

namespace cmdguard::sandbox {

auto CircuitBreaker::record_block() -> bool {
    bool was_open = is_open();
    ++consecutive_blocked_;

    if (!config_.enabled) {
        LOG_DEBUG("CircuitBreaker: {} consecutive blocks (breaker disabled)", consecutive_blocked_);
        return false;
    }

    if (!was_open && is_open()) {
        LOG_ERROR("CircuitBreaker: tripped after {} consecutive blocks (threshold {})",
                  consecutive_blocked_, config_.threshold);
        return true;
    }
    return false;
}

} // namespace cmdguard::sandbox
