#include "routing/region_router.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace regionrouter {

namespace {

CircuitBreaker::Config breaker_config(const CircuitBreakerConfig& cfg) {
    CircuitBreaker::Config config;
    config.failure_threshold = cfg.failure_threshold;
    config.success_threshold = cfg.success_threshold;
    config.timeout = std::chrono::seconds{cfg.timeout_seconds};
    config.enabled = cfg.enabled;
    return config;
}

HealthMonitor::Config monitor_config(const RegionCatalog& catalog) {
    HealthMonitor::Config config;
    config.probe_timeout = std::chrono::seconds{catalog.health_check().timeout_seconds};
    config.unhealthy_threshold = catalog.health_check().unhealthy_threshold;
    config.healthy_threshold = catalog.health_check().healthy_threshold;
    config.latency_thresholds = catalog.latency_thresholds();
    return config;
}

} // anonymous namespace

RegionRouter::RegionRouter(RouterConfig config, std::shared_ptr<IHealthProbe> probe)
    : catalog_(std::move(config)),
      latency_(catalog_.region_ids()),
      breakers_(catalog_.region_ids(), breaker_config(catalog_.circuit_breaker())) {
    if (!probe) {
        throw std::invalid_argument("RegionRouter requires a health probe");
    }
    monitor_ = std::make_unique<HealthMonitor>(
        catalog_, latency_, breakers_, std::move(probe), monitor_config(catalog_));
    engine_ = std::make_unique<RoutingStrategyEngine>(
        catalog_, breakers_, *monitor_, make_routing_strategy(catalog_, latency_));

    utils::log::info(std::format("Region router ready: {} regions ({} active), strategy={}",
                                  catalog_.regions().size(), catalog_.active_regions().size(),
                                  routing_strategy_to_string(catalog_.strategy())));
}

RegionRouter::~RegionRouter() {
    stop_health_checks();
}

std::unique_ptr<RegionRouter> RegionRouter::from_file(const std::string& config_path,
                                                      std::shared_ptr<IHealthProbe> probe) {
    auto result = ConfigLoader::load_from_file(config_path);
    if (!result.success) {
        throw std::runtime_error(result.error_message);
    }
    return std::make_unique<RegionRouter>(std::move(result.config), std::move(probe));
}

// ============================================================================
// Decisions
// ============================================================================

std::optional<RegionConfig> RegionRouter::get_optimal_region(const RouteRequest& request) const {
    const auto* region = engine_->select(request);
    if (!region) {
        utils::log::warn(std::format("No region available (country={}, capability={}, residency={})",
                                      request.source_country.value_or("-"),
                                      request.capability.value_or("-"),
                                      request.data_residency.value_or("-")));
        return std::nullopt;
    }
    return *region;
}

// ============================================================================
// Feedback
// ============================================================================

bool RegionRouter::record_success(const std::string& region_id) {
    return record_outcome(region_id, true);
}

bool RegionRouter::record_failure(const std::string& region_id) {
    return record_outcome(region_id, false);
}

bool RegionRouter::record_outcome(const std::string& region_id, bool success) {
    const auto breaker = breakers_.get_breaker(region_id);
    if (!breaker) {
        utils::log::warn(std::format("Ignoring {} report for unknown region '{}'",
                                      success ? "success" : "failure", region_id));
        return false;
    }
    breaker->record_outcome(success);
    return true;
}

// ============================================================================
// Introspection
// ============================================================================

std::unordered_map<std::string, RegionHealth> RegionRouter::get_region_health_status() const {
    return monitor_->get_all_health();
}

std::unordered_map<std::string, CircuitBreakerStatus> RegionRouter::get_circuit_breaker_status() const {
    return breakers_.get_all_status();
}

std::vector<StateChangeEvent> RegionRouter::recent_breaker_events() const {
    std::vector<StateChangeEvent> events;
    for (const auto& id : catalog_.region_ids()) {
        if (const auto breaker = breakers_.get_breaker(id)) {
            auto recent = breaker->get_recent_events();
            events.insert(events.end(), recent.begin(), recent.end());
        }
    }
    std::stable_sort(events.begin(), events.end(),
        [](const StateChangeEvent& a, const StateChangeEvent& b) { return a.timestamp < b.timestamp; });
    return events;
}

std::vector<RegionConfig> RegionRouter::active_regions() const {
    std::vector<RegionConfig> result;
    for (const auto* region : catalog_.active_regions()) {
        result.push_back(*region);
    }
    return result;
}

std::optional<RegionConfig> RegionRouter::region_by_id(const std::string& region_id) const {
    const auto* region = catalog_.by_id(region_id);
    if (!region) return std::nullopt;
    return *region;
}

// ============================================================================
// Lifecycle
// ============================================================================

std::optional<bool> RegionRouter::probe_region(const std::string& region_id) {
    const auto* region = catalog_.by_id(region_id);
    if (!region) return std::nullopt;
    return monitor_->check_region(*region);
}

void RegionRouter::start_health_checks() {
    const auto& hc = catalog_.health_check();
    if (!hc.enabled) {
        utils::log::info("Health checks disabled in configuration");
        return;
    }
    monitor_->start(std::chrono::seconds{hc.interval_seconds});
}

void RegionRouter::stop_health_checks() {
    monitor_->stop();
}

} // namespace regionrouter
