#include "routing/routing_strategy.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <limits>

namespace regionrouter {

namespace {

const RegionConfig* find_candidate(const std::vector<const RegionConfig*>& candidates,
                                   const std::string& region_id) {
    if (region_id.empty()) return nullptr;
    const auto it = std::find_if(candidates.begin(), candidates.end(),
        [&region_id](const RegionConfig* r) { return r->id == region_id; });
    return (it != candidates.end()) ? *it : nullptr;
}

} // anonymous namespace

// ============================================================================
// Geo-based
// ============================================================================

GeoRoutingStrategy::GeoRoutingStrategy(std::vector<GeoRoutingRule> rules)
    : rules_(std::move(rules)) {
    // Country codes compare upper-case on both sides
    for (auto& rule : rules_) {
        for (auto& country : rule.source_countries) {
            country = utils::to_upper(utils::trim(country));
        }
    }
}

const RegionConfig* GeoRoutingStrategy::select(
    const std::vector<const RegionConfig*>& candidates,
    const RouteRequest& request) const {
    if (candidates.empty()) return nullptr;

    if (request.source_country) {
        const auto country = utils::to_upper(utils::trim(*request.source_country));
        for (const auto& rule : rules_) {
            if (!rule.matches(country)) continue;

            if (const auto* target = find_candidate(candidates, rule.target_region_id)) {
                return target;
            }
            if (const auto* fallback = find_candidate(candidates, rule.fallback_region_id)) {
                return fallback;
            }
            break;  // First matching rule decides
        }
    }

    return candidates.front();
}

// ============================================================================
// Latency-based
// ============================================================================

LatencyRoutingStrategy::LatencyRoutingStrategy(const LatencyTracker& latency)
    : latency_(latency) {}

const RegionConfig* LatencyRoutingStrategy::select(
    const std::vector<const RegionConfig*>& candidates,
    const RouteRequest& /*request*/) const {
    if (candidates.empty()) return nullptr;

    constexpr auto kUnknown = std::numeric_limits<std::chrono::milliseconds::rep>::max();

    // Snapshot p95s once so the sort compares a consistent view
    std::vector<std::pair<std::chrono::milliseconds::rep, const RegionConfig*>> ranked;
    ranked.reserve(candidates.size());
    for (const auto* region : candidates) {
        const auto p95 = latency_.p95(region->id);
        ranked.emplace_back(p95 ? p95->count() : kUnknown, region);
    }

    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    return ranked.front().second;
}

// ============================================================================
// Priority-based
// ============================================================================

const RegionConfig* PriorityRoutingStrategy::select(
    const std::vector<const RegionConfig*>& candidates,
    const RouteRequest& /*request*/) const {
    if (candidates.empty()) return nullptr;

    auto sorted = candidates;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const RegionConfig* a, const RegionConfig* b) { return a->priority < b->priority; });
    return sorted.front();
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IRoutingStrategy> make_routing_strategy(
    const RegionCatalog& catalog, const LatencyTracker& latency) {
    switch (catalog.strategy()) {
        case RoutingStrategyType::GEO_BASED:
            return std::make_unique<GeoRoutingStrategy>(catalog.geo_rules());
        case RoutingStrategyType::LATENCY_BASED:
            return std::make_unique<LatencyRoutingStrategy>(latency);
        case RoutingStrategyType::PRIORITY_BASED:
            return std::make_unique<PriorityRoutingStrategy>();
    }
    return std::make_unique<PriorityRoutingStrategy>();
}

} // namespace regionrouter
