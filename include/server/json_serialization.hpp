#pragma once

#include "core/types.hpp"
#include "failover/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace regionrouter {

// nlohmann::json ADL hooks: `nlohmann::json j = region;`
void to_json(nlohmann::json& j, const HealthEndpoint& endpoint);
void to_json(nlohmann::json& j, const RegionConfig& region);
void to_json(nlohmann::json& j, const RegionHealth& health);
void to_json(nlohmann::json& j, const CircuitBreakerStatus& status);
void to_json(nlohmann::json& j, const StateChangeEvent& event);

/// {"<region id>": {...}} for every entry (keys sorted)
[[nodiscard]] nlohmann::json health_map_to_json(
    const std::unordered_map<std::string, RegionHealth>& health);

[[nodiscard]] nlohmann::json breaker_map_to_json(
    const std::unordered_map<std::string, CircuitBreakerStatus>& breakers);

[[nodiscard]] nlohmann::json regions_to_json(const std::vector<RegionConfig>& regions);

} // namespace regionrouter
