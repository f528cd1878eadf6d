#pragma once

#include "catalog/region_catalog.hpp"
#include "health/latency_tracker.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regionrouter {

/**
 * @brief Inputs to one routing decision (all optional)
 */
struct RouteRequest {
    std::optional<std::string> source_country;      // ISO code, matched case-sensitively
    std::optional<std::string> capability;
    std::optional<std::string> data_residency;
};

/**
 * @brief Picks one region out of an already-filtered candidate list
 *
 * Candidates arrive in catalog order and are never empty; implementations
 * must be deterministic for a given candidate list and request.
 */
class IRoutingStrategy {
public:
    virtual ~IRoutingStrategy() = default;

    [[nodiscard]] virtual const RegionConfig* select(
        const std::vector<const RegionConfig*>& candidates,
        const RouteRequest& request) const = 0;

    [[nodiscard]] virtual RoutingStrategyType type() const = 0;
};

/**
 * @brief First matching geo rule wins: target, then fallback, then the
 *        first candidate in catalog order.
 */
class GeoRoutingStrategy : public IRoutingStrategy {
public:
    explicit GeoRoutingStrategy(std::vector<GeoRoutingRule> rules);

    [[nodiscard]] const RegionConfig* select(
        const std::vector<const RegionConfig*>& candidates,
        const RouteRequest& request) const override;

    [[nodiscard]] RoutingStrategyType type() const override {
        return RoutingStrategyType::GEO_BASED;
    }

private:
    std::vector<GeoRoutingRule> rules_;
};

/**
 * @brief Lowest p95 wins; regions without samples sort last.
 *        Stable on catalog order.
 */
class LatencyRoutingStrategy : public IRoutingStrategy {
public:
    explicit LatencyRoutingStrategy(const LatencyTracker& latency);

    [[nodiscard]] const RegionConfig* select(
        const std::vector<const RegionConfig*>& candidates,
        const RouteRequest& request) const override;

    [[nodiscard]] RoutingStrategyType type() const override {
        return RoutingStrategyType::LATENCY_BASED;
    }

private:
    const LatencyTracker& latency_;
};

/**
 * @brief Lowest priority value wins. Stable on catalog order.
 */
class PriorityRoutingStrategy : public IRoutingStrategy {
public:
    [[nodiscard]] const RegionConfig* select(
        const std::vector<const RegionConfig*>& candidates,
        const RouteRequest& request) const override;

    [[nodiscard]] RoutingStrategyType type() const override {
        return RoutingStrategyType::PRIORITY_BASED;
    }
};

/**
 * @brief Build the strategy named by the catalog's routing policy
 */
[[nodiscard]] std::unique_ptr<IRoutingStrategy> make_routing_strategy(
    const RegionCatalog& catalog, const LatencyTracker& latency);

} // namespace regionrouter
