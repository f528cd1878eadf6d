#pragma once

#include "catalog/region_catalog.hpp"
#include "failover/circuit_breaker_registry.hpp"
#include "health/ihealth_probe.hpp"
#include "health/latency_tracker.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

namespace regionrouter {

/**
 * @brief Periodic health probing with hysteresis
 *
 * A probe round for a region is successful only if every endpoint answers
 * with its expected status inside the probe timeout; the first failing
 * endpoint ends the round. Each round:
 * - records the round-trip of every endpoint that answered in LatencyTracker
 * - updates consecutive success/failure counters; `healthy` flips to false
 *   at unhealthy_threshold failures and back at healthy_threshold successes
 * - feeds the outcome to the region's circuit breaker
 *
 * Scheduling: a single scheduler thread (std::jthread) ticks every interval
 * and dispatches one asynchronous round per active region. A region whose
 * previous round is still running is skipped, so at most one probe is in
 * flight per region while regions run concurrently. Rounds for regions with
 * a breaker still OPEN are skipped until the reset window elapses.
 *
 * Probe failures never escape the loop: transport errors and exceptions
 * thrown by the probe are logged and counted as failed rounds.
 */
class HealthMonitor {
public:
    struct Config {
        std::chrono::milliseconds probe_timeout{5000};
        uint32_t unhealthy_threshold = 3;
        uint32_t healthy_threshold = 2;
        LatencyThresholds latency_thresholds;
    };

    HealthMonitor(const RegionCatalog& catalog,
                  LatencyTracker& latency,
                  CircuitBreakerRegistry& breakers,
                  std::shared_ptr<IHealthProbe> probe,
                  Config config);

    ~HealthMonitor();

    // Non-copyable, non-movable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Run one probe round for a region now
     * @return true if every endpoint answered as expected
     */
    bool probe_once(const RegionConfig& region);

    /**
     * @brief Scheduled round: skips regions whose breaker is still OPEN
     * @return Round result, nullopt if skipped
     */
    std::optional<bool> check_region(const RegionConfig& region);

    /**
     * @brief Start the probe loop (no-op if already running)
     */
    void start(std::chrono::milliseconds interval);

    /**
     * @brief Stop the probe loop and wait for in-flight rounds.
     *        Idempotent; safe before start().
     */
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    [[nodiscard]] bool is_healthy(const std::string& region_id) const;

    /// Copy of one region's health (p95 filled in from LatencyTracker)
    [[nodiscard]] std::optional<RegionHealth> get_health(const std::string& region_id) const;

    /// Copies of every region's health, keyed by region id
    [[nodiscard]] std::unordered_map<std::string, RegionHealth> get_all_health() const;

    /// Classify a p95 against the global thresholds and a per-region target
    [[nodiscard]] static LatencyLevel classify_latency(
        std::optional<std::chrono::milliseconds> p95,
        const LatencyThresholds& thresholds,
        uint32_t region_target_ms);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct HealthSlot {
        mutable std::mutex mutex;
        RegionHealth health;
    };

    void apply_round(const RegionConfig& region, bool success, const std::string& error);
    void schedule_loop(std::stop_token stop, std::chrono::milliseconds interval);
    void dispatch_round();

    const RegionCatalog& catalog_;
    LatencyTracker& latency_;
    CircuitBreakerRegistry& breakers_;
    std::shared_ptr<IHealthProbe> probe_;
    const Config config_;

    // Fixed key set, one slot per catalog region
    std::unordered_map<std::string, std::unique_ptr<HealthSlot>> slots_;

    // Scheduler state (in_flight_ only touched by the scheduler thread,
    // and by stop() after the scheduler has been joined)
    std::unordered_map<std::string, std::future<void>> in_flight_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::jthread scheduler_;
};

} // namespace regionrouter
