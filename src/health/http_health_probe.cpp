#include "health/http_health_probe.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace regionrouter {

std::pair<std::string, std::string> HttpHealthProbe::split_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    const size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {url, ""};
    }

    std::string prefix = url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return {url.substr(0, path_start), std::move(prefix)};
}

ProbeResult HttpHealthProbe::probe(const std::string& base_url,
                                   const HealthEndpoint& endpoint,
                                   std::chrono::milliseconds timeout) {
    ProbeResult result;

    const auto [origin, prefix] = split_url(base_url);
    httplib::Client cli(origin);
    if (!cli.is_valid()) {
        result.error = std::format("invalid deployment url '{}'", base_url);
        return result;
    }
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    const std::string path = prefix + endpoint.path;
    const utils::Timer timer;
    const auto res = cli.Get(path);
    const auto elapsed = timer.elapsed_ms();

    if (!res) {
        result.error = std::format("GET {}{} failed: {}", origin, path, httplib::to_string(res.error()));
        return result;
    }

    result.responded = true;
    result.status = res->status;
    result.latency = elapsed;
    return result;
}

} // namespace regionrouter
