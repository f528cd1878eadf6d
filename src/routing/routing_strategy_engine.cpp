#include "routing/routing_strategy_engine.hpp"

namespace regionrouter {

RoutingStrategyEngine::RoutingStrategyEngine(const RegionCatalog& catalog,
                                             const CircuitBreakerRegistry& breakers,
                                             const HealthMonitor& health,
                                             std::unique_ptr<IRoutingStrategy> strategy)
    : catalog_(catalog),
      breakers_(breakers),
      health_(health),
      strategy_(std::move(strategy)) {}

std::vector<const RegionConfig*> RoutingStrategyEngine::filter_candidates(
    const RouteRequest& request) const {
    std::vector<const RegionConfig*> candidates;

    for (const RegionConfig* region : catalog_.active_regions()) {
        if (request.capability && !region->has_capability(*request.capability)) {
            continue;
        }
        if (request.data_residency && region->data_residency != *request.data_residency) {
            continue;
        }

        const auto breaker = breakers_.get_breaker(region->id);
        if (breaker && !breaker->allow_request()) {
            continue;
        }

        if (!health_.is_healthy(region->id)) {
            continue;
        }

        candidates.push_back(region);
    }

    return candidates;
}

const RegionConfig* RoutingStrategyEngine::select(const RouteRequest& request) const {
    const auto candidates = filter_candidates(request);
    if (candidates.empty()) return nullptr;
    return strategy_->select(candidates, request);
}

} // namespace regionrouter
