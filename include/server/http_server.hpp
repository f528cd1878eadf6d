#pragma once

#include "config/config_types.hpp"
#include "routing/routing_strategy.hpp"

#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace regionrouter {

class RegionRouter;

/**
 * @brief HTTP decision API over a RegionRouter
 *
 * Routes:
 *   GET  /route?country=&capability=&residency=
 *   POST /regions/{id}/success, /regions/{id}/failure
 *   GET  /regions, /regions/health, /regions/circuit-breakers
 *   GET  /regions/circuit-breakers/events
 *   GET  /health
 *
 * start() blocks in listen() on the calling thread; stop() may be called
 * from any other thread (signal handler thread included) to unblock it.
 */
class HttpServer {
public:
    HttpServer(RegionRouter& router, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Register routes and listen (blocking). Throws std::runtime_error on bind failure.
    void start();
    void stop();

    /**
     * @brief Build a RouteRequest from raw query values
     *
     * Empty values mean "not specified". Country codes are upper-cased.
     */
    [[nodiscard]] static RouteRequest make_route_request(const std::string& country,
                                                         const std::string& capability,
                                                         const std::string& residency);

private:
    void register_routes(httplib::Server& svr);

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_route(const httplib::Request& req, httplib::Response& res);
    void handle_feedback(const httplib::Request& req, httplib::Response& res, bool success);
    void handle_regions(const httplib::Request& req, httplib::Response& res);
    void handle_regions_health(const httplib::Request& req, httplib::Response& res);
    void handle_circuit_breakers(const httplib::Request& req, httplib::Response& res);
    void handle_breaker_events(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    RegionRouter& router_;
    const ServerConfig config_;

    std::unique_ptr<httplib::Server> server_;
    std::mutex server_mutex_;
};

} // namespace regionrouter
