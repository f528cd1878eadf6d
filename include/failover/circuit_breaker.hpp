#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace regionrouter {

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

/**
 * @brief Circuit Breaker for region failure isolation
 *
 * Three states:
 * - CLOSED:     Normal operation, region is a routing candidate
 * - OPEN:       Failing, region is never returned as a candidate
 * - HALF_OPEN:  Testing recovery, region is eligible for trial traffic
 *
 * State transitions:
 * - CLOSED → OPEN:      failure_count >= failure_threshold
 * - OPEN → HALF_OPEN:   lazily, on the first touch at or after next_attempt_time
 * - HALF_OPEN → CLOSED: success_count >= success_threshold
 * - HALF_OPEN → OPEN:   any failure
 *
 * Health probes and real-traffic feedback both go through record_outcome(),
 * the only place counters and transitions change. Every field is guarded by
 * one mutex, so status snapshots are never torn.
 */
class CircuitBreaker {
public:
    /**
     * @brief Configuration
     */
    struct Config {
        uint32_t failure_threshold;         // Failures to trip OPEN
        uint32_t success_threshold;         // Successes to close from HALF_OPEN
        std::chrono::milliseconds timeout;  // Time in OPEN before HALF_OPEN
        bool enabled;                       // false = count only, never trip

        Config()
            : failure_threshold(5),
              success_threshold(2),
              timeout(60000),
              enabled(true) {}
    };

    /**
     * @brief Construct circuit breaker
     * @param name Circuit breaker identifier (region id)
     * @param config Configuration
     */
    explicit CircuitBreaker(std::string name, const Config& config = Config());

    /**
     * @brief Touch the breaker: OPEN moves to HALF_OPEN once the reset
     *        window has elapsed.
     * @return true unless the breaker is (still) OPEN
     */
    bool allow_request();

    /**
     * @brief Single merge point for probe and traffic outcomes
     */
    void record_outcome(bool success);

    void record_success() { record_outcome(true); }
    void record_failure() { record_outcome(false); }

    /**
     * @brief Get current state (no lazy transition)
     */
    CircuitState get_state() const;

    /**
     * @brief Snapshot of all counters and timestamps
     */
    CircuitBreakerStatus get_status() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    const std::string& name() const { return name_; }

    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions (invoked outside the lock)
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    using Clock = std::chrono::system_clock;

    // All *_locked helpers require mutex_ held; transitions are queued in
    // `pending` and emitted after the lock is released.
    void refresh_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending);
    void trip_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending);
    void attempt_reset_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending);
    void close_circuit_locked(Clock::time_point now, std::vector<StateChangeEvent>& pending);

    void emit_transitions(const std::vector<StateChangeEvent>& events);

    const std::string name_;
    const Config config_;

    mutable std::mutex mutex_;
    CircuitBreakerStatus status_;

    // State change events
    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    mutable std::mutex events_mutex_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace regionrouter
