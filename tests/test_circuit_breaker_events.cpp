#include <catch2/catch_test_macros.hpp>
#include "failover/circuit_breaker.hpp"
#include "failover/circuit_breaker_registry.hpp"
#include "health/health_monitor.hpp"
#include "mocks/mock_health_probe.hpp"
#include "mocks/test_config.hpp"

#include <thread>

using namespace regionrouter;
using namespace regionrouter::testing;
using std::chrono::milliseconds;

TEST_CASE("CircuitBreaker: every entry to OPEN schedules the next attempt", "[circuit_breaker][events]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 2;
    cfg.success_threshold = 2;
    cfg.timeout = milliseconds(20);
    CircuitBreaker cb("eu-west-1", cfg);

    // Interleaved success keeps the failure run below threshold
    cb.record_outcome(false);
    cb.record_outcome(true);
    cb.record_outcome(false);
    REQUIRE(cb.get_state() == CircuitState::CLOSED);
    CHECK_FALSE(cb.get_status().next_attempt_time.has_value());

    cb.record_outcome(false);
    REQUIRE(cb.get_state() == CircuitState::OPEN);
    auto events = cb.get_recent_events();
    REQUIRE(events.size() == 1);
    auto status = cb.get_status();
    REQUIRE(status.next_attempt_time.has_value());
    CHECK(*status.next_attempt_time == events.back().timestamp + cfg.timeout);
    CHECK(status.last_failure_time.has_value());

    // The failing outcome after the window is both the trial and its verdict
    std::this_thread::sleep_for(milliseconds(40));
    cb.record_outcome(false);
    REQUIRE(cb.get_state() == CircuitState::OPEN);

    events = cb.get_recent_events();
    REQUIRE(events.size() == 3);
    CHECK(events[1].from == CircuitState::OPEN);
    CHECK(events[1].to == CircuitState::HALF_OPEN);
    CHECK(events[2].from == CircuitState::HALF_OPEN);
    CHECK(events[2].to == CircuitState::OPEN);
    CHECK(events[1].timestamp == events[2].timestamp);

    status = cb.get_status();
    REQUIRE(status.next_attempt_time.has_value());
    CHECK(*status.next_attempt_time == events.back().timestamp + cfg.timeout);
    CHECK(status.transitions_to_open == 2);
    CHECK(status.transitions_to_half_open == 1);
    CHECK(status.transitions_to_closed == 0);
}

TEST_CASE("CircuitBreaker: leaving OPEN clears the next attempt", "[circuit_breaker][events]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.success_threshold = 2;
    cfg.timeout = milliseconds(10);
    CircuitBreaker cb("ap-southeast-1", cfg);

    cb.record_outcome(false);
    REQUIRE(cb.get_status().next_attempt_time.has_value());

    std::this_thread::sleep_for(milliseconds(30));
    cb.record_outcome(true);
    auto status = cb.get_status();
    CHECK(status.state == CircuitState::HALF_OPEN);
    CHECK_FALSE(status.next_attempt_time.has_value());
    CHECK(status.success_count == 1);

    cb.record_outcome(true);
    status = cb.get_status();
    CHECK(status.state == CircuitState::CLOSED);
    CHECK_FALSE(status.next_attempt_time.has_value());
    CHECK(status.transitions_to_open == 1);
    CHECK(status.transitions_to_half_open == 1);
    CHECK(status.transitions_to_closed == 1);
}

TEST_CASE("CircuitBreaker: reset cycles keep only the latest 100 events", "[circuit_breaker][events]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    CircuitBreaker cb("us-west-2", cfg);

    // Each cycle records CLOSED->OPEN then OPEN->CLOSED
    for (int i = 0; i < 60; ++i) {
        cb.record_outcome(false);
        cb.reset();
    }

    const auto events = cb.get_recent_events();
    REQUIRE(events.size() == 100);
    CHECK(events.front().from == CircuitState::CLOSED);
    CHECK(events.front().to == CircuitState::OPEN);
    CHECK(events.back().from == CircuitState::OPEN);
    CHECK(events.back().to == CircuitState::CLOSED);
    for (size_t i = 1; i < events.size(); ++i) {
        CHECK(events[i - 1].timestamp <= events[i].timestamp);
    }

    const auto status = cb.get_status();
    CHECK(status.transitions_to_open == 60);
    CHECK(status.transitions_to_closed == 60);
    CHECK(status.transitions_to_half_open == 0);
}

TEST_CASE("CircuitBreaker: failed health rounds trip and record the event", "[circuit_breaker][events][health]") {
    const RegionCatalog catalog(make_config({make_region("eu-central-1"), make_region("us-east-1")}));
    LatencyTracker latency(catalog.region_ids());

    CircuitBreaker::Config cb;
    cb.failure_threshold = 2;
    cb.timeout = milliseconds(30);
    CircuitBreakerRegistry breakers(catalog.region_ids(), cb);

    std::vector<StateChangeEvent> captured;
    breakers.set_on_state_change([&](const StateChangeEvent& e) { captured.push_back(e); });

    auto probe = std::make_shared<MockHealthProbe>();
    probe->set_status("http://eu-central-1/health", 503);
    HealthMonitor monitor(catalog, latency, breakers, probe, HealthMonitor::Config());
    const auto& region = *catalog.by_id("eu-central-1");

    CHECK(monitor.check_region(region) == std::optional<bool>(false));
    CHECK(monitor.check_region(region) == std::optional<bool>(false));

    const auto breaker = breakers.get_breaker("eu-central-1");
    REQUIRE(breaker->get_state() == CircuitState::OPEN);
    REQUIRE(captured.size() == 1);
    CHECK(captured[0].breaker_name == "eu-central-1");
    CHECK(captured[0].from == CircuitState::CLOSED);
    CHECK(captured[0].to == CircuitState::OPEN);
    CHECK(breaker->get_recent_events().size() == 1);
    CHECK(*breaker->get_status().next_attempt_time == captured[0].timestamp + cb.timeout);

    // The healthy neighbour is untouched
    CHECK(breakers.get_breaker("us-east-1")->get_recent_events().empty());

    // Skipped while OPEN: no probe, no event
    const auto probes_before = probe->probe_count();
    CHECK_FALSE(monitor.check_region(region).has_value());
    CHECK(probe->probe_count() == probes_before);
    CHECK(captured.size() == 1);

    // Still failing after the window: HALF_OPEN trial re-opens, third failure flips health
    std::this_thread::sleep_for(milliseconds(60));
    CHECK(monitor.check_region(region) == std::optional<bool>(false));
    REQUIRE(captured.size() == 3);
    CHECK(captured[1].to == CircuitState::HALF_OPEN);
    CHECK(captured[2].from == CircuitState::HALF_OPEN);
    CHECK(captured[2].to == CircuitState::OPEN);
    CHECK(breaker->get_status().transitions_to_open == 2);
    CHECK_FALSE(monitor.is_healthy("eu-central-1"));
}

TEST_CASE("CircuitBreaker: recovering health round closes the breaker", "[circuit_breaker][events][health]") {
    const RegionCatalog catalog(make_config({make_region("us-east-1")}));
    LatencyTracker latency(catalog.region_ids());

    CircuitBreaker::Config cb;
    cb.failure_threshold = 1;
    cb.success_threshold = 1;
    cb.timeout = milliseconds(20);
    CircuitBreakerRegistry breakers(catalog.region_ids(), cb);

    auto probe = std::make_shared<MockHealthProbe>();
    probe->set_down("http://us-east-1/health");
    HealthMonitor monitor(catalog, latency, breakers, probe, HealthMonitor::Config());
    const auto& region = *catalog.by_id("us-east-1");

    CHECK(monitor.check_region(region) == std::optional<bool>(false));
    REQUIRE(breakers.get_breaker("us-east-1")->get_state() == CircuitState::OPEN);

    probe->set_up("http://us-east-1/health");
    std::this_thread::sleep_for(milliseconds(40));
    CHECK(monitor.check_region(region) == std::optional<bool>(true));

    const auto status = breakers.get_breaker("us-east-1")->get_status();
    CHECK(status.state == CircuitState::CLOSED);
    CHECK(status.transitions_to_open == 1);
    CHECK(status.transitions_to_half_open == 1);
    CHECK(status.transitions_to_closed == 1);
    CHECK_FALSE(status.next_attempt_time.has_value());

    const auto events = breakers.get_breaker("us-east-1")->get_recent_events();
    REQUIRE(events.size() == 3);
    CHECK(events[2].from == CircuitState::HALF_OPEN);
    CHECK(events[2].to == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreakerRegistry: one breaker per region, unknown ids absent", "[circuit_breaker][registry]") {
    CircuitBreakerRegistry registry({"us-east-1", "eu-west-1"}, CircuitBreaker::Config());

    CHECK(registry.size() == 2);
    REQUIRE(registry.get_breaker("us-east-1") != nullptr);
    CHECK(registry.get_breaker("us-east-1") == registry.get_breaker("us-east-1"));
    CHECK(registry.get_breaker("mars-1") == nullptr);
    CHECK(registry.size() == 2);

    const auto all = registry.get_all_status();
    CHECK(all.size() == 2);
    CHECK(all.at("eu-west-1").state == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreakerRegistry: callback installed on every breaker", "[circuit_breaker][registry]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    CircuitBreakerRegistry registry({"a", "b"}, cfg);

    std::vector<std::string> opened;
    registry.set_on_state_change([&](const StateChangeEvent& e) {
        opened.push_back(e.breaker_name);
    });

    registry.get_breaker("b")->record_failure();
    registry.get_breaker("a")->record_failure();

    CHECK(opened == std::vector<std::string>{"b", "a"});
}
