#include "failover/circuit_breaker_registry.hpp"

namespace regionrouter {

CircuitBreakerRegistry::CircuitBreakerRegistry(const std::vector<std::string>& region_ids,
                                               const CircuitBreaker::Config& config) {
    breakers_.reserve(region_ids.size());
    for (const auto& id : region_ids) {
        breakers_.try_emplace(id, std::make_shared<CircuitBreaker>(id, config));
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_breaker(const std::string& region_id) const {
    const auto it = breakers_.find(region_id);
    return (it != breakers_.end()) ? it->second : nullptr;
}

std::unordered_map<std::string, CircuitBreakerStatus> CircuitBreakerRegistry::get_all_status() const {
    std::unordered_map<std::string, CircuitBreakerStatus> result;
    result.reserve(breakers_.size());
    for (const auto& [id, breaker] : breakers_) {
        result.emplace(id, breaker->get_status());
    }
    return result;
}

void CircuitBreakerRegistry::set_on_state_change(
    const std::function<void(const StateChangeEvent&)>& cb) {
    for (const auto& [id, breaker] : breakers_) {
        breaker->set_on_state_change(cb);
    }
}

} // namespace regionrouter
