#pragma once

#include "core/types.hpp"

#include <chrono>
#include <string>

namespace regionrouter {

/**
 * @brief Outcome of one request against one health endpoint
 */
struct ProbeResult {
    bool responded = false;                 // false = timeout / connection error
    int status = 0;                         // HTTP status when responded
    std::chrono::milliseconds latency{0};   // Round-trip time when responded
    std::string error;
};

/**
 * @brief Transport used by HealthMonitor to reach a region's endpoints
 *
 * Implementations must bound every call by `timeout` and report transport
 * failures through ProbeResult rather than by throwing.
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    [[nodiscard]] virtual ProbeResult probe(const std::string& base_url,
                                            const HealthEndpoint& endpoint,
                                            std::chrono::milliseconds timeout) = 0;
};

} // namespace regionrouter
