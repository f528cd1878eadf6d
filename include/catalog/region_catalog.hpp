#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace regionrouter {

/**
 * @brief Immutable catalog of configured regions plus the global routing
 *        and failover policy.
 *
 * Built once at startup. Construction validates the config (duplicate ids,
 * thresholds, geo rule references) and throws std::invalid_argument on
 * failure, so no router can be assembled over a partially-valid catalog.
 *
 * Regions without their own health endpoints inherit the global
 * failover.health_check.endpoints, then a single GET /health -> 200.
 *
 * Thread-safety: read-only after construction.
 */
class RegionCatalog {
public:
    explicit RegionCatalog(RouterConfig config);

    /**
     * @brief Load and validate a catalog from a TOML file
     * @return Catalog, or CONFIG_ERROR with the loader's message
     */
    [[nodiscard]] static Result<RegionCatalog> load(const std::string& config_path);

    /// All regions in declaration (catalog) order
    [[nodiscard]] const std::vector<RegionConfig>& regions() const { return config_.regions; }

    /// Regions with status == active, in catalog order
    [[nodiscard]] std::vector<const RegionConfig*> active_regions() const;

    /// Region by id, or nullptr
    [[nodiscard]] const RegionConfig* by_id(const std::string& region_id) const;

    [[nodiscard]] bool contains(const std::string& region_id) const;

    /// Position of the region in catalog order (tie-break key)
    [[nodiscard]] size_t index_of(const std::string& region_id) const;

    [[nodiscard]] std::vector<std::string> region_ids() const;

    [[nodiscard]] RoutingStrategyType strategy() const { return config_.routing.strategy; }
    [[nodiscard]] const std::vector<GeoRoutingRule>& geo_rules() const { return config_.routing.geo_rules; }
    [[nodiscard]] const LatencyThresholds& latency_thresholds() const { return config_.routing.latency_thresholds; }
    [[nodiscard]] const HealthCheckConfig& health_check() const { return config_.failover.health_check; }
    [[nodiscard]] const CircuitBreakerConfig& circuit_breaker() const { return config_.failover.circuit_breaker; }
    [[nodiscard]] const RouterConfig& config() const { return config_; }

private:
    RouterConfig config_;
    std::unordered_map<std::string, size_t> index_;     // region id -> position
};

} // namespace regionrouter
