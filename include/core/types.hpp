#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regionrouter {

// ============================================================================
// Basic Enums
// ============================================================================

enum class RegionStatus {
    ACTIVE,
    INACTIVE,
    MAINTENANCE
};

enum class RoutingStrategyType {
    GEO_BASED,
    LATENCY_BASED,
    PRIORITY_BASED
};

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, excluded from routing
    HALF_OPEN       // Testing recovery, eligible for trial traffic
};

enum class LatencyLevel {
    UNKNOWN,        // No samples yet
    OK,
    WARN,
    CRITICAL
};

// ============================================================================
// Region Catalog Types (immutable after load)
// ============================================================================

struct HealthEndpoint {
    std::string path = "/health";
    int expected_status = 200;
};

struct RegionConfig {
    std::string id;
    std::string name;
    std::string provider;
    int priority = 100;                         // Lower = preferred
    RegionStatus status = RegionStatus::ACTIVE;
    std::vector<std::string> capabilities;
    std::string data_residency;
    std::vector<HealthEndpoint> health_endpoints;
    std::string deployment_url;
    uint32_t latency_target_p95_ms = 0;         // 0 = no per-region target

    [[nodiscard]] bool is_active() const { return status == RegionStatus::ACTIVE; }

    [[nodiscard]] bool has_capability(std::string_view capability) const {
        return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
    }
};

struct GeoRoutingRule {
    std::vector<std::string> source_countries;
    std::string target_region_id;
    std::string fallback_region_id;             // Empty = no fallback

    [[nodiscard]] bool matches(std::string_view country) const {
        return std::find(source_countries.begin(), source_countries.end(), country)
            != source_countries.end();
    }
};

// ============================================================================
// Per-Region Runtime State (snapshots handed out to callers)
// ============================================================================

struct RegionHealth {
    std::string region_id;
    bool healthy = true;
    uint32_t consecutive_failures = 0;
    uint32_t consecutive_successes = 0;
    std::chrono::system_clock::time_point last_check_time;
    std::optional<std::chrono::milliseconds> latency_p95;   // nullopt = no samples
    LatencyLevel latency_level = LatencyLevel::UNKNOWN;
    std::string last_error;
    uint64_t total_probes = 0;
    uint64_t failed_probes = 0;
};

struct CircuitBreakerStatus {
    CircuitState state = CircuitState::CLOSED;
    uint64_t failure_count = 0;
    uint64_t success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    std::optional<std::chrono::system_clock::time_point> next_attempt_time;  // Set only while OPEN
    uint64_t transitions_to_open = 0;
    uint64_t transitions_to_half_open = 0;
    uint64_t transitions_to_closed = 0;
};

// ============================================================================
// String Conversion
// ============================================================================

inline const char* region_status_to_string(RegionStatus status) {
    switch (status) {
        case RegionStatus::ACTIVE:      return "active";
        case RegionStatus::INACTIVE:    return "inactive";
        case RegionStatus::MAINTENANCE: return "maintenance";
        default:                        return "unknown";
    }
}

inline const char* routing_strategy_to_string(RoutingStrategyType type) {
    switch (type) {
        case RoutingStrategyType::GEO_BASED:      return "geo-based";
        case RoutingStrategyType::LATENCY_BASED:  return "latency-based";
        case RoutingStrategyType::PRIORITY_BASED: return "priority-based";
        default:                                  return "unknown";
    }
}

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default:                      return "unknown";
    }
}

inline const char* latency_level_to_string(LatencyLevel level) {
    switch (level) {
        case LatencyLevel::UNKNOWN:  return "unknown";
        case LatencyLevel::OK:       return "ok";
        case LatencyLevel::WARN:     return "warn";
        case LatencyLevel::CRITICAL: return "critical";
        default:                     return "unknown";
    }
}

} // namespace regionrouter
