#include "failover/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace regionrouter {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {}

bool CircuitBreaker::allow_request() {
    std::vector<StateChangeEvent> pending;
    bool allowed = false;
    {
        std::lock_guard lock(mutex_);
        refresh_locked(Clock::now(), pending);
        allowed = status_.state != CircuitState::OPEN;
    }
    emit_transitions(pending);
    return allowed;
}

void CircuitBreaker::record_outcome(bool success) {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard lock(mutex_);
        const auto now = Clock::now();

        // An outcome is a touch: an elapsed reset window opens the trial first
        refresh_locked(now, pending);

        if (success) {
            ++status_.success_count;
            status_.failure_count = 0;

            if (status_.state == CircuitState::HALF_OPEN &&
                status_.success_count >= config_.success_threshold) {
                close_circuit_locked(now, pending);
            }
        } else {
            ++status_.failure_count;
            status_.success_count = 0;
            status_.last_failure_time = now;

            if (status_.state == CircuitState::HALF_OPEN) {
                // Any failure in HALF_OPEN → back to OPEN
                trip_locked(now, pending);
            } else if (status_.state == CircuitState::CLOSED &&
                       status_.failure_count >= config_.failure_threshold) {
                trip_locked(now, pending);
            }
        }
    }
    emit_transitions(pending);
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    return status_.state;
}

CircuitBreakerStatus CircuitBreaker::get_status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

void CircuitBreaker::reset() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard lock(mutex_);
        if (status_.state != CircuitState::CLOSED) {
            close_circuit_locked(Clock::now(), pending);
        }
        status_.success_count = 0;
        status_.failure_count = 0;
        status_.last_failure_time.reset();
    }
    emit_transitions(pending);
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(events_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

// ============================================================================
// Transitions (mutex_ held)
// ============================================================================

void CircuitBreaker::refresh_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending) {
    if (status_.state != CircuitState::OPEN) return;
    if (status_.next_attempt_time && now >= *status_.next_attempt_time) {
        attempt_reset_locked(now, pending);
    }
}

void CircuitBreaker::trip_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending) {
    if (!config_.enabled) return;

    const auto from = status_.state;
    status_.state = CircuitState::OPEN;
    status_.success_count = 0;
    status_.next_attempt_time = now + config_.timeout;
    ++status_.transitions_to_open;
    pending.push_back({from, CircuitState::OPEN, now, name_});
}

void CircuitBreaker::attempt_reset_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending) {
    status_.state = CircuitState::HALF_OPEN;
    status_.success_count = 0;
    status_.failure_count = 0;
    status_.next_attempt_time.reset();
    ++status_.transitions_to_half_open;
    pending.push_back({CircuitState::OPEN, CircuitState::HALF_OPEN, now, name_});
}

void CircuitBreaker::close_circuit_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending) {
    const auto from = status_.state;
    status_.state = CircuitState::CLOSED;
    status_.success_count = 0;
    status_.failure_count = 0;
    status_.next_attempt_time.reset();
    ++status_.transitions_to_closed;
    pending.push_back({from, CircuitState::CLOSED, now, name_});
}

// ============================================================================
// Event emission (no breaker lock held)
// ============================================================================

void CircuitBreaker::emit_transitions(const std::vector<StateChangeEvent>& events) {
    if (events.empty()) return;

    std::function<void(const StateChangeEvent&)> callback;
    {
        std::lock_guard lock(events_mutex_);
        for (const auto& event : events) {
            recent_events_.push_back(event);
            while (recent_events_.size() > kMaxRecentEvents) {
                recent_events_.pop_front();
            }
        }
        callback = on_state_change_;
    }

    for (const auto& event : events) {
        const auto msg = std::format("Circuit breaker {} for region {}: {} -> {}",
            event.to == CircuitState::OPEN ? "opened" :
                (event.to == CircuitState::CLOSED ? "closed" : "half-open"),
            name_,
            circuit_state_to_string(event.from),
            circuit_state_to_string(event.to));
        if (event.to == CircuitState::OPEN) {
            utils::log::error(msg);
        } else {
            utils::log::info(msg);
        }

        if (callback) {
            callback(event);
        }
    }
}

} // namespace regionrouter
