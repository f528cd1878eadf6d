#pragma once

#include "failover/circuit_breaker.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace regionrouter {

/**
 * @brief One circuit breaker per configured region.
 *
 * The key set is fixed at construction (one breaker per catalog region), so
 * lookups never lock the map and unknown ids never create state. Each
 * breaker serializes its own fields.
 */
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(const std::vector<std::string>& region_ids,
                           const CircuitBreaker::Config& config);

    /**
     * @brief Get the breaker for a region
     * @return Shared pointer to the breaker, nullptr if the id is unknown
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& region_id) const;

    /**
     * @brief Status snapshot for every breaker, keyed by region id
     */
    [[nodiscard]] std::unordered_map<std::string, CircuitBreakerStatus> get_all_status() const;

    /**
     * @brief Install the same transition callback on every breaker
     */
    void set_on_state_change(const std::function<void(const StateChangeEvent&)>& cb);

    [[nodiscard]] size_t size() const { return breakers_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace regionrouter
