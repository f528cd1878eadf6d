#include <catch2/catch_test_macros.hpp>
#include "health/health_monitor.hpp"
#include "mocks/mock_health_probe.hpp"
#include "mocks/test_config.hpp"

#include <thread>

using namespace regionrouter;
using namespace regionrouter::testing;
using std::chrono::milliseconds;

namespace {

// Catalog + tracker + breakers + monitor wired over a mock probe
struct MonitorFixture {
    explicit MonitorFixture(RouterConfig config,
                            HealthMonitor::Config monitor_config = HealthMonitor::Config(),
                            CircuitBreaker::Config breaker_config = CircuitBreaker::Config())
        : catalog(std::move(config)),
          latency(catalog.region_ids()),
          breakers(catalog.region_ids(), breaker_config),
          probe(std::make_shared<MockHealthProbe>()),
          monitor(catalog, latency, breakers, probe, monitor_config) {}

    const RegionConfig& region(const std::string& id) const { return *catalog.by_id(id); }

    RegionCatalog catalog;
    LatencyTracker latency;
    CircuitBreakerRegistry breakers;
    std::shared_ptr<MockHealthProbe> probe;
    HealthMonitor monitor;
};

} // anonymous namespace

TEST_CASE("HealthMonitor: every region starts healthy", "[health]") {
    MonitorFixture f(make_config({make_region("a"), make_region("b")}));

    const auto all = f.monitor.get_all_health();
    REQUIRE(all.size() == 2);
    for (const auto& [id, health] : all) {
        CHECK(health.region_id == id);
        CHECK(health.healthy);
        CHECK(health.consecutive_failures == 0);
        CHECK(health.latency_level == LatencyLevel::UNKNOWN);
        CHECK_FALSE(health.latency_p95.has_value());
    }
    CHECK_FALSE(f.monitor.get_health("mars-1").has_value());
    CHECK_FALSE(f.monitor.is_healthy("mars-1"));
}

TEST_CASE("HealthMonitor: hysteresis flips unhealthy on third failure", "[health][hysteresis]") {
    MonitorFixture f(make_config({make_region("a")}));
    f.probe->set_down("http://a/health");
    const auto& region = f.region("a");

    CHECK_FALSE(f.monitor.probe_once(region));
    CHECK_FALSE(f.monitor.probe_once(region));
    CHECK(f.monitor.is_healthy("a"));
    CHECK(f.monitor.get_health("a")->consecutive_failures == 2);

    CHECK_FALSE(f.monitor.probe_once(region));
    CHECK_FALSE(f.monitor.is_healthy("a"));

    const auto health = f.monitor.get_health("a");
    CHECK(health->consecutive_failures == 3);
    CHECK(health->consecutive_successes == 0);
    CHECK(health->total_probes == 3);
    CHECK(health->failed_probes == 3);
    CHECK(health->last_error.find("/health") != std::string::npos);
}

TEST_CASE("HealthMonitor: hysteresis recovers after healthy threshold", "[health][hysteresis]") {
    MonitorFixture f(make_config({make_region("a")}));
    const auto& region = f.region("a");

    f.probe->set_down("http://a/health");
    for (int i = 0; i < 3; ++i) f.monitor.probe_once(region);
    REQUIRE_FALSE(f.monitor.is_healthy("a"));

    f.probe->set_up("http://a/health");
    CHECK(f.monitor.probe_once(region));
    CHECK_FALSE(f.monitor.is_healthy("a"));
    CHECK(f.monitor.probe_once(region));
    CHECK(f.monitor.is_healthy("a"));
    CHECK(f.monitor.get_health("a")->consecutive_failures == 0);
}

TEST_CASE("HealthMonitor: single flake does not flip health", "[health][hysteresis]") {
    MonitorFixture f(make_config({make_region("a")}));
    const auto& region = f.region("a");

    f.probe->set_down("http://a/health");
    f.monitor.probe_once(region);
    f.monitor.probe_once(region);
    f.probe->set_up("http://a/health");
    f.monitor.probe_once(region);
    f.probe->set_down("http://a/health");
    f.monitor.probe_once(region);
    f.monitor.probe_once(region);

    CHECK(f.monitor.is_healthy("a"));
}

TEST_CASE("HealthMonitor: fail-fast across endpoints", "[health]") {
    auto region = make_region("a");
    region.health_endpoints = {{"/health", 200}, {"/ready", 204}, {"/db", 200}};
    MonitorFixture f(make_config({region}));

    f.probe->set_status("http://a/ready", 500);

    CHECK_FALSE(f.monitor.probe_once(f.region("a")));

    // /db never probed once /ready failed
    const auto calls = f.probe->calls();
    CHECK(calls == std::vector<std::string>{"http://a/health", "http://a/ready"});

    const auto health = f.monitor.get_health("a");
    CHECK(health->last_error.find("expected status 204, got 500") != std::string::npos);
}

TEST_CASE("HealthMonitor: every endpoint must pass", "[health]") {
    auto region = make_region("a");
    region.health_endpoints = {{"/health", 200}, {"/ready", 204}};
    MonitorFixture f(make_config({region}));

    f.probe->set_status("http://a/ready", 204);
    CHECK(f.monitor.probe_once(f.region("a")));
    CHECK(f.probe->calls().size() == 2);
}

TEST_CASE("HealthMonitor: responding endpoints record latency", "[health][latency]") {
    MonitorFixture f(make_config({make_region("a")}));

    MockHealthProbe::Response slow;
    slow.latency = milliseconds(42);
    f.probe->set_response("http://a/health", slow);
    f.monitor.probe_once(f.region("a"));

    CHECK(f.latency.sample_count("a") == 1);
    CHECK(f.monitor.get_health("a")->latency_p95 == milliseconds(42));

    // Wrong status still measured a round-trip
    slow.status = 503;
    f.probe->set_response("http://a/health", slow);
    f.monitor.probe_once(f.region("a"));
    CHECK(f.latency.sample_count("a") == 2);

    // No response, no sample
    f.probe->set_down("http://a/health");
    f.monitor.probe_once(f.region("a"));
    CHECK(f.latency.sample_count("a") == 2);
}

TEST_CASE("HealthMonitor: probe exceptions count as failures", "[health]") {
    MonitorFixture f(make_config({make_region("a")}));

    MockHealthProbe::Response boom;
    boom.throws = true;
    f.probe->set_response("http://a/health", boom);

    CHECK_NOTHROW(f.monitor.probe_once(f.region("a")));
    const auto health = f.monitor.get_health("a");
    CHECK(health->failed_probes == 1);
    CHECK(health->last_error.find("mock probe exploded") != std::string::npos);
}

TEST_CASE("HealthMonitor: non-standard exceptions count as failures", "[health]") {
    MonitorFixture f(make_config({make_region("a")}));

    MockHealthProbe::Response odd;
    odd.throws_foreign = true;
    f.probe->set_response("http://a/health", odd);

    bool result = true;
    CHECK_NOTHROW(result = f.monitor.probe_once(f.region("a")));
    CHECK_FALSE(result);
    const auto health = f.monitor.get_health("a");
    CHECK(health->failed_probes == 1);
    CHECK(health->last_error.find("non-standard exception") != std::string::npos);
    CHECK(f.breakers.get_breaker("a")->get_status().failure_count == 1);
}

TEST_CASE("HealthMonitor: probe rounds feed the circuit breaker", "[health][circuit_breaker]") {
    CircuitBreaker::Config cb;
    cb.failure_threshold = 2;
    MonitorFixture f(make_config({make_region("a")}), HealthMonitor::Config(), cb);
    f.probe->set_down("http://a/health");

    f.monitor.probe_once(f.region("a"));
    f.monitor.probe_once(f.region("a"));

    CHECK(f.breakers.get_breaker("a")->get_state() == CircuitState::OPEN);
    // Health hysteresis (threshold 3) has not flipped yet
    CHECK(f.monitor.is_healthy("a"));
}

TEST_CASE("HealthMonitor: rounds skipped while breaker is OPEN", "[health][circuit_breaker]") {
    CircuitBreaker::Config cb;
    cb.failure_threshold = 1;
    cb.success_threshold = 1;
    cb.timeout = milliseconds(50);
    MonitorFixture f(make_config({make_region("a")}), HealthMonitor::Config(), cb);

    f.breakers.get_breaker("a")->record_failure();
    REQUIRE(f.breakers.get_breaker("a")->get_state() == CircuitState::OPEN);

    CHECK_FALSE(f.monitor.check_region(f.region("a")).has_value());
    CHECK(f.probe->probe_count() == 0);

    std::this_thread::sleep_for(milliseconds(100));

    // Window elapsed: the round is the HALF_OPEN trial and closes the breaker
    const auto result = f.monitor.check_region(f.region("a"));
    REQUIRE(result.has_value());
    CHECK(*result);
    CHECK(f.breakers.get_breaker("a")->get_state() == CircuitState::CLOSED);
}

TEST_CASE("HealthMonitor: latency level classification", "[health][latency]") {
    LatencyThresholds t;
    t.warn_ms = 200;
    t.critical_ms = 500;

    CHECK(HealthMonitor::classify_latency(std::nullopt, t, 0) == LatencyLevel::UNKNOWN);
    CHECK(HealthMonitor::classify_latency(milliseconds(50), t, 0) == LatencyLevel::OK);
    CHECK(HealthMonitor::classify_latency(milliseconds(200), t, 0) == LatencyLevel::WARN);
    CHECK(HealthMonitor::classify_latency(milliseconds(600), t, 0) == LatencyLevel::CRITICAL);
    // Per-region target tighter than the global warn threshold
    CHECK(HealthMonitor::classify_latency(milliseconds(120), t, 100) == LatencyLevel::WARN);
    CHECK(HealthMonitor::classify_latency(milliseconds(80), t, 100) == LatencyLevel::OK);
}

TEST_CASE("HealthMonitor: latency level tracked per round", "[health][latency]") {
    HealthMonitor::Config cfg;
    cfg.latency_thresholds.warn_ms = 100;
    cfg.latency_thresholds.critical_ms = 300;
    MonitorFixture f(make_config({make_region("a")}), cfg);

    MockHealthProbe::Response r;
    r.latency = milliseconds(400);
    f.probe->set_response("http://a/health", r);
    f.monitor.probe_once(f.region("a"));

    CHECK(f.monitor.get_health("a")->latency_level == LatencyLevel::CRITICAL);
}

TEST_CASE("HealthMonitor: stop is idempotent and safe before start", "[health][lifecycle]") {
    MonitorFixture f(make_config({make_region("a")}));

    CHECK_NOTHROW(f.monitor.stop());
    CHECK_NOTHROW(f.monitor.stop());
    CHECK_FALSE(f.monitor.is_running());

    f.monitor.start(milliseconds(20));
    CHECK(f.monitor.is_running());
    f.monitor.start(milliseconds(20));    // No-op
    CHECK(f.monitor.is_running());

    f.monitor.stop();
    CHECK_FALSE(f.monitor.is_running());
    CHECK_NOTHROW(f.monitor.stop());
}

TEST_CASE("HealthMonitor: loop probes every active region", "[health][lifecycle]") {
    auto parked = make_region("parked");
    parked.status = RegionStatus::MAINTENANCE;
    MonitorFixture f(make_config({make_region("a"), make_region("b"), parked}));

    f.monitor.start(milliseconds(20));
    std::this_thread::sleep_for(milliseconds(300));
    f.monitor.stop();

    CHECK(f.monitor.get_health("a")->total_probes >= 1);
    CHECK(f.monitor.get_health("b")->total_probes >= 1);
    CHECK(f.monitor.get_health("parked")->total_probes == 0);

    // Nothing runs after stop
    const auto count = f.probe->probe_count();
    std::this_thread::sleep_for(milliseconds(100));
    CHECK(f.probe->probe_count() == count);
}

TEST_CASE("HealthMonitor: slow region does not stall others", "[health][lifecycle]") {
    MonitorFixture f(make_config({make_region("slow"), make_region("fast")}));

    MockHealthProbe::Response stuck;
    stuck.delay = milliseconds(400);
    f.probe->set_response("http://slow/health", stuck);

    f.monitor.start(milliseconds(20));
    std::this_thread::sleep_for(milliseconds(250));

    // Fast region probed many times while the slow one has one round in flight
    CHECK(f.monitor.get_health("fast")->total_probes >= 2);
    CHECK(f.monitor.get_health("slow")->total_probes == 0);

    f.monitor.stop();   // Waits for the in-flight slow round
    CHECK(f.monitor.get_health("slow")->total_probes == 1);
}

TEST_CASE("HealthMonitor: loop survives a health check throwing a non-standard exception", "[health][lifecycle]") {
    MonitorFixture f(make_config({make_region("odd"), make_region("fine")}));

    MockHealthProbe::Response odd;
    odd.throws_foreign = true;
    f.probe->set_response("http://odd/health", odd);

    f.monitor.start(milliseconds(20));
    std::this_thread::sleep_for(milliseconds(300));
    CHECK(f.monitor.is_running());
    f.monitor.stop();

    // Repeated rounds on the throwing region, each recorded as a failure
    const auto odd_health = f.monitor.get_health("odd");
    CHECK(odd_health->total_probes >= 3);
    CHECK(odd_health->failed_probes == odd_health->total_probes);
    CHECK_FALSE(odd_health->healthy);
    CHECK(f.monitor.get_health("fine")->total_probes >= 2);
    CHECK(f.monitor.get_health("fine")->failed_probes == 0);
}
