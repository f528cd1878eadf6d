#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regionrouter {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads regions.toml into a validated RouterConfig
 *
 * Supported document shape:
 * - [server], [logging]
 * - [routing] strategy, [routing.latency_thresholds], [[routing.geo_rules]]
 * - [failover.health_check], [failover.circuit_breaker]
 * - [[regions]] with optional [[regions.health_endpoints]]
 *
 * String values may reference environment variables as ${VAR_NAME}.
 * Nothing is thrown: every failure is reported through LoadResult.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RouterConfig config;

        static LoadResult ok(RouterConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to regions.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic validation of an already-typed config
     * @return One message per violation (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RouterConfig& config);

    [[nodiscard]] static std::optional<RoutingStrategyType> parse_strategy(std::string_view name);
    [[nodiscard]] static std::optional<RegionStatus> parse_region_status(std::string_view name);

private:
    static LoadResult validate_and_return(RouterConfig config);
};

} // namespace regionrouter
