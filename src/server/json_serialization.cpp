#include "server/json_serialization.hpp"
#include "core/utils.hpp"

namespace regionrouter {

namespace {

nlohmann::json optional_timestamp(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? nlohmann::json(utils::format_timestamp(*tp)) : nlohmann::json(nullptr);
}

} // anonymous namespace

void to_json(nlohmann::json& j, const HealthEndpoint& endpoint) {
    j = nlohmann::json{
        {"path", endpoint.path},
        {"expected_status", endpoint.expected_status}
    };
}

void to_json(nlohmann::json& j, const RegionConfig& region) {
    j = nlohmann::json{
        {"id", region.id},
        {"name", region.name},
        {"provider", region.provider},
        {"priority", region.priority},
        {"status", region_status_to_string(region.status)},
        {"capabilities", region.capabilities},
        {"data_residency", region.data_residency},
        {"deployment_url", region.deployment_url},
        {"health_endpoints", region.health_endpoints}
    };
    if (region.latency_target_p95_ms > 0) {
        j["latency_target_p95_ms"] = region.latency_target_p95_ms;
    }
}

void to_json(nlohmann::json& j, const RegionHealth& health) {
    j = nlohmann::json{
        {"region_id", health.region_id},
        {"healthy", health.healthy},
        {"consecutive_failures", health.consecutive_failures},
        {"consecutive_successes", health.consecutive_successes},
        {"latency_level", latency_level_to_string(health.latency_level)},
        {"total_probes", health.total_probes},
        {"failed_probes", health.failed_probes}
    };
    // Never-probed regions report a null check time
    j["last_check_time"] = (health.total_probes > 0)
        ? nlohmann::json(utils::format_timestamp(health.last_check_time))
        : nlohmann::json(nullptr);
    j["latency_p95_ms"] = health.latency_p95
        ? nlohmann::json(health.latency_p95->count())
        : nlohmann::json(nullptr);
    j["last_error"] = health.last_error.empty()
        ? nlohmann::json(nullptr)
        : nlohmann::json(health.last_error);
}

void to_json(nlohmann::json& j, const CircuitBreakerStatus& status) {
    j = nlohmann::json{
        {"state", circuit_state_to_string(status.state)},
        {"failure_count", status.failure_count},
        {"success_count", status.success_count},
        {"last_failure_time", optional_timestamp(status.last_failure_time)},
        {"next_attempt_time", optional_timestamp(status.next_attempt_time)},
        {"transitions", {
            {"to_open", status.transitions_to_open},
            {"to_half_open", status.transitions_to_half_open},
            {"to_closed", status.transitions_to_closed}
        }}
    };
}

void to_json(nlohmann::json& j, const StateChangeEvent& event) {
    j = nlohmann::json{
        {"breaker", event.breaker_name},
        {"from", circuit_state_to_string(event.from)},
        {"to", circuit_state_to_string(event.to)},
        {"timestamp", utils::format_timestamp(event.timestamp)}
    };
}

nlohmann::json health_map_to_json(const std::unordered_map<std::string, RegionHealth>& health) {
    auto j = nlohmann::json::object();
    for (const auto& [id, h] : health) {
        j[id] = h;
    }
    return j;
}

nlohmann::json breaker_map_to_json(
    const std::unordered_map<std::string, CircuitBreakerStatus>& breakers) {
    auto j = nlohmann::json::object();
    for (const auto& [id, status] : breakers) {
        j[id] = status;
    }
    return j;
}

nlohmann::json regions_to_json(const std::vector<RegionConfig>& regions) {
    auto j = nlohmann::json::array();
    for (const auto& region : regions) {
        j.push_back(region);
    }
    return j;
}

} // namespace regionrouter
