#pragma once

#include "catalog/region_catalog.hpp"
#include "failover/circuit_breaker_registry.hpp"
#include "health/health_monitor.hpp"
#include "routing/routing_strategy.hpp"

#include <memory>
#include <vector>

namespace regionrouter {

/**
 * @brief Candidate filtering followed by strategy selection
 *
 * Filter order is fixed:
 *   status == active -> capability -> data residency -> breaker not OPEN -> healthy
 *
 * The breaker check is a touch: an OPEN breaker whose reset window has
 * elapsed moves to HALF_OPEN here and the region stays a candidate.
 */
class RoutingStrategyEngine {
public:
    RoutingStrategyEngine(const RegionCatalog& catalog,
                          const CircuitBreakerRegistry& breakers,
                          const HealthMonitor& health,
                          std::unique_ptr<IRoutingStrategy> strategy);

    /// Surviving regions, in catalog order
    [[nodiscard]] std::vector<const RegionConfig*> filter_candidates(const RouteRequest& request) const;

    /// Selected region, nullptr when no candidate survives filtering
    [[nodiscard]] const RegionConfig* select(const RouteRequest& request) const;

    [[nodiscard]] const IRoutingStrategy& strategy() const { return *strategy_; }

private:
    const RegionCatalog& catalog_;
    const CircuitBreakerRegistry& breakers_;
    const HealthMonitor& health_;
    std::unique_ptr<IRoutingStrategy> strategy_;
};

} // namespace regionrouter
