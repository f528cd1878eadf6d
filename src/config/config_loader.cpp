#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace regionrouter {

// Constexpr config keys (used 2+ times in extraction)
static constexpr std::string_view kRegions         = "regions";
static constexpr std::string_view kRouting         = "routing";
static constexpr std::string_view kFailover        = "failover";
static constexpr std::string_view kHealthEndpoints = "health_endpoints";
static constexpr std::string_view kEndpoints       = "endpoints";
static constexpr std::string_view kExpectedStatus  = "expected_status";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Non-negative integer that must fit in uint32_t; `path` names the key in errors
uint32_t toml_u32(const toml::table& tbl, const std::string_view key,
                  const uint32_t default_val, const std::string_view path) {
    const auto node = tbl[key];
    if (!node) return default_val;
    const auto value = node.value<int64_t>();
    if (!value) {
        throw std::runtime_error(std::format("{}.{} must be an integer", path, key));
    }
    if (*value < 0 || *value > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(
            std::format("{}.{} out of range: {}", path, key, *value));
    }
    return static_cast<uint32_t>(*value);
}

std::vector<HealthEndpoint> extract_endpoints(const toml::array* arr, const std::string& path) {
    std::vector<HealthEndpoint> endpoints;
    if (!arr) return endpoints;

    endpoints.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw std::runtime_error(std::format("{}[{}] must be a table", path, i));
        }
        HealthEndpoint ep;
        ep.path = (*tbl)["path"].value_or(""s);
        ep.expected_status = (*tbl)[kExpectedStatus].value_or(200);
        endpoints.push_back(std::move(ep));
    }
    return endpoints;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = s["port"].value_or(cfg.port);
    cfg.threads = static_cast<size_t>(toml_u32(s, "threads", static_cast<uint32_t>(cfg.threads), "server"));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

RoutingConfig extract_routing(const toml::table& root) {
    RoutingConfig cfg;
    const auto* routing = root[kRouting].as_table();
    if (!routing) {
        throw std::runtime_error("[routing] section is required");
    }
    const auto& r = *routing;

    const auto strategy_name = r["strategy"].value<std::string>();
    if (!strategy_name) {
        throw std::runtime_error("routing.strategy is required");
    }
    const auto strategy = ConfigLoader::parse_strategy(*strategy_name);
    if (!strategy) {
        throw std::runtime_error(std::format(
            "routing.strategy: unknown strategy '{}' (expected geo-based, latency-based or priority-based)",
            *strategy_name));
    }
    cfg.strategy = *strategy;

    if (const auto* thresholds = r["latency_thresholds"].as_table()) {
        cfg.latency_thresholds.warn_ms = toml_u32(
            *thresholds, "warn_ms", cfg.latency_thresholds.warn_ms, "routing.latency_thresholds");
        cfg.latency_thresholds.critical_ms = toml_u32(
            *thresholds, "critical_ms", cfg.latency_thresholds.critical_ms, "routing.latency_thresholds");
    }

    if (const auto* rules = r["geo_rules"].as_array()) {
        for (size_t i = 0; i < rules->size(); ++i) {
            const auto* tbl = (*rules)[i].as_table();
            if (!tbl) {
                throw std::runtime_error(std::format("routing.geo_rules[{}] must be a table", i));
            }
            GeoRoutingRule rule;
            rule.source_countries = toml_string_array(*tbl, "source_countries");
            for (auto& country : rule.source_countries) {
                country = utils::to_upper(country);
            }
            rule.target_region_id = (*tbl)["target_region"].value_or(""s);
            rule.fallback_region_id = (*tbl)["fallback_region"].value_or(""s);
            cfg.geo_rules.push_back(std::move(rule));
        }
    }
    return cfg;
}

FailoverConfig extract_failover(const toml::table& root) {
    FailoverConfig cfg;
    const auto* failover = root[kFailover].as_table();
    if (!failover) return cfg;

    if (const auto* hc = (*failover)["health_check"].as_table()) {
        constexpr std::string_view path = "failover.health_check";
        auto& h = cfg.health_check;
        h.enabled = (*hc)["enabled"].value_or(h.enabled);
        h.interval_seconds = toml_u32(*hc, "interval_seconds", h.interval_seconds, path);
        h.timeout_seconds = toml_u32(*hc, "timeout_seconds", h.timeout_seconds, path);
        h.unhealthy_threshold = toml_u32(*hc, "unhealthy_threshold", h.unhealthy_threshold, path);
        h.healthy_threshold = toml_u32(*hc, "healthy_threshold", h.healthy_threshold, path);
        h.endpoints = extract_endpoints((*hc)[kEndpoints].as_array(),
                                        "failover.health_check.endpoints");
    }

    if (const auto* cb = (*failover)["circuit_breaker"].as_table()) {
        constexpr std::string_view path = "failover.circuit_breaker";
        auto& c = cfg.circuit_breaker;
        c.enabled = (*cb)["enabled"].value_or(c.enabled);
        c.failure_threshold = toml_u32(*cb, "failure_threshold", c.failure_threshold, path);
        c.success_threshold = toml_u32(*cb, "success_threshold", c.success_threshold, path);
        c.timeout_seconds = toml_u32(*cb, "timeout_seconds", c.timeout_seconds, path);
    }
    return cfg;
}

std::vector<RegionConfig> extract_regions(const toml::table& root) {
    std::vector<RegionConfig> regions;
    const auto* arr = root[kRegions].as_array();
    if (!arr) {
        throw std::runtime_error("No [[regions]] array found in configuration");
    }

    regions.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* node = (*arr)[i].as_table();
        if (!node) {
            throw std::runtime_error(std::format("regions[{}] must be a table", i));
        }
        const auto& tbl = *node;
        const std::string path = std::format("regions[{}]", i);

        RegionConfig region;
        region.id = tbl["id"].value_or(""s);
        region.name = tbl["name"].value_or(region.id);
        region.provider = tbl["provider"].value_or(""s);
        region.priority = tbl["priority"].value_or(region.priority);

        const std::string status_str = tbl["status"].value_or("active"s);
        const auto status = ConfigLoader::parse_region_status(status_str);
        if (!status) {
            throw std::runtime_error(std::format(
                "{}.status: unknown value '{}' (expected active, inactive or maintenance)",
                path, status_str));
        }
        region.status = *status;

        region.capabilities = toml_string_array(tbl, "capabilities");
        region.data_residency = tbl["data_residency"].value_or(""s);
        region.deployment_url = tbl["deployment_url"].value_or(""s);
        region.latency_target_p95_ms = toml_u32(tbl, "latency_target_p95_ms", 0, path);
        region.health_endpoints = extract_endpoints(tbl[kHealthEndpoints].as_array(),
                                                    path + ".health_endpoints");
        regions.push_back(std::move(region));
    }
    return regions;
}

RouterConfig extract_all_sections(const toml::table& tbl) {
    RouterConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.routing = extract_routing(tbl);
    config.failover = extract_failover(tbl);
    config.regions = extract_regions(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<RoutingStrategyType> ConfigLoader::parse_strategy(std::string_view name) {
    static const std::unordered_map<std::string_view, RoutingStrategyType> lookup = {
        {"geo-based",      RoutingStrategyType::GEO_BASED},
        {"latency-based",  RoutingStrategyType::LATENCY_BASED},
        {"priority-based", RoutingStrategyType::PRIORITY_BASED},
    };

    const auto it = lookup.find(name);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<RegionStatus> ConfigLoader::parse_region_status(std::string_view name) {
    const std::string lower = utils::to_lower(name);

    static const std::unordered_map<std::string, RegionStatus> lookup = {
        {"active",      RegionStatus::ACTIVE},
        {"inactive",    RegionStatus::INACTIVE},
        {"maintenance", RegionStatus::MAINTENANCE},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RouterConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RouterConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.threads == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level: unknown level '{}'", config.logging.level));
    }

    // ---- Regions ----
    if (config.regions.empty()) {
        errors.push_back("regions: at least one [[regions]] entry is required");
    }

    const auto validate_endpoints = [&errors](const std::vector<HealthEndpoint>& endpoints,
                                              const std::string& path) {
        for (size_t j = 0; j < endpoints.size(); ++j) {
            const auto& ep = endpoints[j];
            if (ep.path.empty() || ep.path.front() != '/') {
                errors.push_back(std::format("{}[{}].path must start with '/', got '{}'",
                                             path, j, ep.path));
            }
            if (ep.expected_status < 100 || ep.expected_status > 599) {
                errors.push_back(std::format("{}[{}].expected_status must be 100-599, got {}",
                                             path, j, ep.expected_status));
            }
        }
    };

    std::unordered_set<std::string> seen_ids;
    for (size_t i = 0; i < config.regions.size(); ++i) {
        const auto& region = config.regions[i];
        if (region.id.empty()) {
            errors.push_back(std::format("regions[{}].id must not be empty", i));
        } else if (!seen_ids.insert(region.id).second) {
            errors.push_back(std::format("regions[{}].id: duplicate region id '{}'", i, region.id));
        }
        if (config.failover.health_check.enabled && region.is_active() &&
            region.deployment_url.empty()) {
            errors.push_back(std::format(
                "regions[{}].deployment_url required for active region '{}' when health checks are enabled",
                i, region.id));
        }
        validate_endpoints(region.health_endpoints, std::format("regions[{}].health_endpoints", i));
    }

    // ---- Routing ----
    for (size_t i = 0; i < config.routing.geo_rules.size(); ++i) {
        const auto& rule = config.routing.geo_rules[i];
        if (rule.source_countries.empty()) {
            errors.push_back(std::format("routing.geo_rules[{}].source_countries must not be empty", i));
        }
        if (rule.target_region_id.empty()) {
            errors.push_back(std::format("routing.geo_rules[{}].target_region must not be empty", i));
        } else if (!seen_ids.contains(rule.target_region_id)) {
            errors.push_back(std::format("routing.geo_rules[{}].target_region: unknown region '{}'",
                                         i, rule.target_region_id));
        }
        if (!rule.fallback_region_id.empty() && !seen_ids.contains(rule.fallback_region_id)) {
            errors.push_back(std::format("routing.geo_rules[{}].fallback_region: unknown region '{}'",
                                         i, rule.fallback_region_id));
        }
    }

    const auto& thresholds = config.routing.latency_thresholds;
    if (thresholds.warn_ms > thresholds.critical_ms) {
        errors.push_back(std::format(
            "routing.latency_thresholds.warn_ms ({}) > critical_ms ({})",
            thresholds.warn_ms, thresholds.critical_ms));
    }

    // ---- Failover ----
    const auto& hc = config.failover.health_check;
    if (hc.interval_seconds == 0) {
        errors.push_back("failover.health_check.interval_seconds must be > 0");
    }
    if (hc.timeout_seconds == 0) {
        errors.push_back("failover.health_check.timeout_seconds must be > 0");
    }
    if (hc.unhealthy_threshold == 0) {
        errors.push_back("failover.health_check.unhealthy_threshold must be > 0");
    }
    if (hc.healthy_threshold == 0) {
        errors.push_back("failover.health_check.healthy_threshold must be > 0");
    }
    validate_endpoints(hc.endpoints, "failover.health_check.endpoints");

    const auto& cb = config.failover.circuit_breaker;
    if (cb.failure_threshold == 0) {
        errors.push_back("failover.circuit_breaker.failure_threshold must be > 0");
    }
    if (cb.success_threshold == 0) {
        errors.push_back("failover.circuit_breaker.success_threshold must be > 0");
    }
    if (cb.timeout_seconds == 0) {
        errors.push_back("failover.circuit_breaker.timeout_seconds must be > 0");
    }

    return errors;
}

} // namespace regionrouter
