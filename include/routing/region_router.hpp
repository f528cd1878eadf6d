#pragma once

#include "catalog/region_catalog.hpp"
#include "config/config_types.hpp"
#include "failover/circuit_breaker_registry.hpp"
#include "health/health_monitor.hpp"
#include "health/ihealth_probe.hpp"
#include "health/latency_tracker.hpp"
#include "routing/routing_strategy_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace regionrouter {

/**
 * @brief Region routing and failover façade
 *
 * Owns the catalog and one health record, one circuit breaker and one
 * latency window per configured region, all created at construction, so
 * get_optimal_region() is safe to call before health checks ever run.
 *
 * Two signals feed each region's breaker: health probe rounds and caller
 * feedback after real traffic. Both go through record_outcome().
 *
 * Explicitly constructed and passed to whatever needs routing decisions;
 * there is no process-wide instance.
 *
 * Thread-safety: every public method may be called concurrently.
 */
class RegionRouter {
public:
    /**
     * @throws std::invalid_argument if the config does not validate
     */
    RegionRouter(RouterConfig config, std::shared_ptr<IHealthProbe> probe);

    ~RegionRouter();

    RegionRouter(const RegionRouter&) = delete;
    RegionRouter& operator=(const RegionRouter&) = delete;

    /**
     * @brief Load a TOML config and build a router over it
     * @throws std::runtime_error with the loader's message on failure
     */
    [[nodiscard]] static std::unique_ptr<RegionRouter> from_file(
        const std::string& config_path, std::shared_ptr<IHealthProbe> probe);

    /**
     * @brief Pick a region for a request
     * @return Copy of the chosen region, nullopt when no region is available
     */
    [[nodiscard]] std::optional<RegionConfig> get_optimal_region(const RouteRequest& request) const;

    /// Caller feedback; false (and a warning) for unknown ids
    bool record_success(const std::string& region_id);
    bool record_failure(const std::string& region_id);
    bool record_outcome(const std::string& region_id, bool success);

    [[nodiscard]] std::unordered_map<std::string, RegionHealth> get_region_health_status() const;
    [[nodiscard]] std::unordered_map<std::string, CircuitBreakerStatus> get_circuit_breaker_status() const;

    /// Recent breaker transitions across all regions, oldest first
    [[nodiscard]] std::vector<StateChangeEvent> recent_breaker_events() const;

    /**
     * @brief Run one health probe round for a region now (breaker gating applies)
     * @return Round result; nullopt for unknown ids or a skipped round
     */
    std::optional<bool> probe_region(const std::string& region_id);

    void start_health_checks();
    void stop_health_checks();
    [[nodiscard]] bool is_monitoring() const { return monitor_->is_running(); }

    [[nodiscard]] std::vector<RegionConfig> active_regions() const;
    [[nodiscard]] std::optional<RegionConfig> region_by_id(const std::string& region_id) const;

    [[nodiscard]] const RegionCatalog& catalog() const { return catalog_; }
    [[nodiscard]] RoutingStrategyType strategy() const { return engine_->strategy().type(); }

private:
    // Declaration order is construction order
    RegionCatalog catalog_;
    LatencyTracker latency_;
    CircuitBreakerRegistry breakers_;
    std::unique_ptr<HealthMonitor> monitor_;
    std::unique_ptr<RoutingStrategyEngine> engine_;
};

} // namespace regionrouter
