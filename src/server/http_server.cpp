#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/json_serialization.hpp"
#include "routing/region_router.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace regionrouter {

using json = nlohmann::json;

HttpServer::HttpServer(RegionRouter& router, ServerConfig config)
    : router_(router),
      config_(std::move(config)) {}

HttpServer::~HttpServer() = default;

RouteRequest HttpServer::make_route_request(const std::string& country,
                                            const std::string& capability,
                                            const std::string& residency) {
    RouteRequest request;
    if (const auto c = utils::trim(country); !c.empty()) {
        request.source_country = utils::to_upper(c);
    }
    if (const auto c = utils::trim(capability); !c.empty()) {
        request.capability = c;
    }
    if (const auto r = utils::trim(residency); !r.empty()) {
        request.data_residency = r;
    }
    return request;
}

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = config_.threads;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*svr);

    utils::log::info(std::format("Starting region router on {}:{} ({} threads)",
        config_.host, config_.port, config_.threads));

    if (!svr->listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
                                             config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (server_ && server_->is_running()) {
        server_->stop();
        utils::log::info("Server stopped");
    }
}

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get("/route", [this](const httplib::Request& req, httplib::Response& res) {
        handle_route(req, res);
    });
    // cpp-httplib regex paths for /regions/:id/{success,failure}
    svr.Post(R"(/regions/([^/]+)/success)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_feedback(req, res, true);
    });
    svr.Post(R"(/regions/([^/]+)/failure)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_feedback(req, res, false);
    });
    svr.Get("/regions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_regions(req, res);
    });
    svr.Get("/regions/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_regions_health(req, res);
    });
    svr.Get("/regions/circuit-breakers", [this](const httplib::Request& req, httplib::Response& res) {
        handle_circuit_breakers(req, res);
    });
    svr.Get("/regions/circuit-breakers/events", [this](const httplib::Request& req, httplib::Response& res) {
        handle_breaker_events(req, res);
    });
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_route(const httplib::Request& req, httplib::Response& res) {
    const auto request = make_route_request(
        req.get_param_value(http::kCountryParam),
        req.get_param_value(http::kCapabilityParam),
        req.get_param_value(http::kResidencyParam));

    const auto region = router_.get_optimal_region(request);
    if (!region) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"error":"no region available"})", http::kJsonContentType);
        return;
    }

    const json body = {
        {"region", *region},
        {"strategy", routing_strategy_to_string(router_.strategy())}
    };
    res.set_content(body.dump(), http::kJsonContentType);
}

void HttpServer::handle_feedback(const httplib::Request& req, httplib::Response& res, bool success) {
    const std::string region_id = req.matches[1];
    if (!router_.record_outcome(region_id, success)) {
        res.status = httplib::StatusCode::NotFound_404;
        const json body = {{"error", std::format("unknown region '{}'", region_id)}};
        res.set_content(body.dump(), http::kJsonContentType);
        return;
    }
    res.set_content(R"({"recorded":true})", http::kJsonContentType);
}

void HttpServer::handle_regions(const httplib::Request& /*req*/, httplib::Response& res) {
    const json body = {{"regions", regions_to_json(router_.active_regions())}};
    res.set_content(body.dump(), http::kJsonContentType);
}

void HttpServer::handle_regions_health(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(health_map_to_json(router_.get_region_health_status()).dump(),
                    http::kJsonContentType);
}

void HttpServer::handle_circuit_breakers(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(breaker_map_to_json(router_.get_circuit_breaker_status()).dump(),
                    http::kJsonContentType);
}

void HttpServer::handle_breaker_events(const httplib::Request& /*req*/, httplib::Response& res) {
    const json body = {{"events", router_.recent_breaker_events()}};
    res.set_content(body.dump(), http::kJsonContentType);
}

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    const json body = {
        {"status", "ok"},
        {"monitoring", router_.is_monitoring()}
    };
    res.set_content(body.dump(), http::kJsonContentType);
}

} // namespace regionrouter
