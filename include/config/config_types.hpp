#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace regionrouter {

// ============================================================================
// Server Config (decision API daemon)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8090;
    size_t threads = 8;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Routing Config
// ============================================================================

struct LatencyThresholds {
    uint32_t warn_ms = 200;
    uint32_t critical_ms = 500;
};

struct RoutingConfig {
    RoutingStrategyType strategy = RoutingStrategyType::PRIORITY_BASED;
    std::vector<GeoRoutingRule> geo_rules;      // Evaluated in declaration order
    LatencyThresholds latency_thresholds;
};

// ============================================================================
// Failover Config
// ============================================================================

struct HealthCheckConfig {
    bool enabled = true;
    uint32_t interval_seconds = 30;
    uint32_t timeout_seconds = 5;               // Per-probe bound
    uint32_t unhealthy_threshold = 3;
    uint32_t healthy_threshold = 2;
    std::vector<HealthEndpoint> endpoints;      // Default for regions without their own
};

struct CircuitBreakerConfig {
    bool enabled = true;
    uint32_t failure_threshold = 5;
    uint32_t success_threshold = 2;
    uint32_t timeout_seconds = 60;              // OPEN -> HALF_OPEN reset window
};

struct FailoverConfig {
    HealthCheckConfig health_check;
    CircuitBreakerConfig circuit_breaker;
};

// ============================================================================
// RouterConfig - Complete parsed configuration
// ============================================================================

struct RouterConfig {
    ServerConfig server;
    LoggingConfig logging;
    std::vector<RegionConfig> regions;          // Catalog order
    RoutingConfig routing;
    FailoverConfig failover;
};

} // namespace regionrouter
