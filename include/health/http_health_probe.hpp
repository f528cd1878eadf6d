#pragma once

#include "health/ihealth_probe.hpp"

#include <string>
#include <utility>

namespace regionrouter {

/**
 * @brief IHealthProbe over HTTP(S) via httplib::Client
 *
 * Issues GET <deployment_url><path>. Connection, read and write timeouts
 * are all set to the per-probe timeout. A deployment URL may carry a path
 * prefix (https://host/api); it is prepended to the endpoint path.
 */
class HttpHealthProbe : public IHealthProbe {
public:
    HttpHealthProbe() = default;

    [[nodiscard]] ProbeResult probe(const std::string& base_url,
                                    const HealthEndpoint& endpoint,
                                    std::chrono::milliseconds timeout) override;

    /**
     * @brief Split "scheme://host[:port][/prefix]" into origin and prefix
     * @return {origin, prefix}; prefix has no trailing slash
     */
    [[nodiscard]] static std::pair<std::string, std::string> split_url(const std::string& url);
};

} // namespace regionrouter
