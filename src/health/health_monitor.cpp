#include "health/health_monitor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace regionrouter {

HealthMonitor::HealthMonitor(const RegionCatalog& catalog,
                             LatencyTracker& latency,
                             CircuitBreakerRegistry& breakers,
                             std::shared_ptr<IHealthProbe> probe,
                             Config config)
    : catalog_(catalog),
      latency_(latency),
      breakers_(breakers),
      probe_(std::move(probe)),
      config_(std::move(config)) {
    slots_.reserve(catalog_.regions().size());
    for (const auto& region : catalog_.regions()) {
        auto slot = std::make_unique<HealthSlot>();
        slot->health.region_id = region.id;
        slots_.emplace(region.id, std::move(slot));
    }
}

HealthMonitor::~HealthMonitor() {
    stop();
}

// ============================================================================
// Probe round
// ============================================================================

bool HealthMonitor::probe_once(const RegionConfig& region) {
    bool success = true;
    std::string error;

    for (const auto& endpoint : region.health_endpoints) {
        ProbeResult result;
        try {
            result = probe_->probe(region.deployment_url, endpoint, config_.probe_timeout);
        } catch (const std::exception& e) {
            success = false;
            error = std::format("{}: probe threw: {}", endpoint.path, e.what());
            break;
        } catch (...) {
            success = false;
            error = std::format("{}: probe threw a non-standard exception", endpoint.path);
            break;
        }

        if (!result.responded) {
            success = false;
            error = std::format("{}: {}", endpoint.path,
                                result.error.empty() ? "no response" : result.error);
            break;
        }

        latency_.record(region.id, result.latency);

        if (result.latency > config_.probe_timeout) {
            success = false;
            error = std::format("{}: responded after {}ms (timeout {}ms)", endpoint.path,
                                result.latency.count(), config_.probe_timeout.count());
            break;
        }
        if (result.status != endpoint.expected_status) {
            success = false;
            error = std::format("{}: expected status {}, got {}", endpoint.path,
                                endpoint.expected_status, result.status);
            break;
        }
    }

    apply_round(region, success, error);
    return success;
}

std::optional<bool> HealthMonitor::check_region(const RegionConfig& region) {
    const auto breaker = breakers_.get_breaker(region.id);
    if (breaker && !breaker->allow_request()) {
        return std::nullopt;
    }
    return probe_once(region);
}

void HealthMonitor::apply_round(const RegionConfig& region, bool success, const std::string& error) {
    const auto it = slots_.find(region.id);
    if (it == slots_.end()) {
        utils::log::warn(std::format("Health monitor: unknown region '{}'", region.id));
        return;
    }

    const auto level = classify_latency(latency_.p95(region.id),
                                        config_.latency_thresholds,
                                        region.latency_target_p95_ms);
    bool became_unhealthy = false;
    bool became_healthy = false;
    LatencyLevel previous_level = LatencyLevel::UNKNOWN;
    {
        auto& slot = *it->second;
        std::lock_guard<std::mutex> lock(slot.mutex);
        auto& h = slot.health;

        h.last_check_time = utils::now();
        ++h.total_probes;
        if (success) {
            ++h.consecutive_successes;
            h.consecutive_failures = 0;
            if (!h.healthy && h.consecutive_successes >= config_.healthy_threshold) {
                h.healthy = true;
                became_healthy = true;
            }
        } else {
            ++h.failed_probes;
            ++h.consecutive_failures;
            h.consecutive_successes = 0;
            h.last_error = error;
            if (h.healthy && h.consecutive_failures >= config_.unhealthy_threshold) {
                h.healthy = false;
                became_unhealthy = true;
            }
        }

        previous_level = h.latency_level;
        h.latency_level = level;
    }

    if (!success) {
        utils::log::warn(std::format("Health check failed for region {}: {}", region.id, error));
    }
    if (became_unhealthy) {
        utils::log::error(std::format("Region {} marked unhealthy", region.id));
    }
    if (became_healthy) {
        utils::log::info(std::format("Region {} recovered, marked healthy", region.id));
    }
    if (level != previous_level && (level == LatencyLevel::WARN || level == LatencyLevel::CRITICAL)) {
        const auto p95 = latency_.p95(region.id).value_or(std::chrono::milliseconds{0});
        const auto msg = std::format("Region {} p95 latency {}ms is {}",
                                     region.id, p95.count(), latency_level_to_string(level));
        if (level == LatencyLevel::CRITICAL) {
            utils::log::error(msg);
        } else {
            utils::log::warn(msg);
        }
    }

    if (const auto breaker = breakers_.get_breaker(region.id)) {
        breaker->record_outcome(success);
    }
}

LatencyLevel HealthMonitor::classify_latency(std::optional<std::chrono::milliseconds> p95,
                                             const LatencyThresholds& thresholds,
                                             uint32_t region_target_ms) {
    if (!p95) return LatencyLevel::UNKNOWN;

    const auto ms = static_cast<uint64_t>(p95->count());
    if (ms >= thresholds.critical_ms) return LatencyLevel::CRITICAL;
    if (ms >= thresholds.warn_ms) return LatencyLevel::WARN;
    if (region_target_ms > 0 && ms > region_target_ms) return LatencyLevel::WARN;
    return LatencyLevel::OK;
}

// ============================================================================
// Snapshots
// ============================================================================

bool HealthMonitor::is_healthy(const std::string& region_id) const {
    const auto it = slots_.find(region_id);
    if (it == slots_.end()) return false;
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->health.healthy;
}

std::optional<RegionHealth> HealthMonitor::get_health(const std::string& region_id) const {
    const auto it = slots_.find(region_id);
    if (it == slots_.end()) return std::nullopt;

    RegionHealth copy;
    {
        std::lock_guard<std::mutex> lock(it->second->mutex);
        copy = it->second->health;
    }
    copy.latency_p95 = latency_.p95(region_id);
    return copy;
}

std::unordered_map<std::string, RegionHealth> HealthMonitor::get_all_health() const {
    std::unordered_map<std::string, RegionHealth> result;
    result.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        if (auto health = get_health(id)) {
            result.emplace(id, std::move(*health));
        }
    }
    return result;
}

// ============================================================================
// Lifecycle
// ============================================================================

void HealthMonitor::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) return;
    running_.store(true);
    scheduler_ = std::jthread([this, interval](std::stop_token stop) {
        schedule_loop(std::move(stop), interval);
    });
    utils::log::info(std::format("Health monitor started: {} regions every {}ms",
                                  catalog_.active_regions().size(), interval.count()));
}

void HealthMonitor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) return;
    running_.store(false);
    if (scheduler_.joinable()) {
        scheduler_.request_stop();
        scheduler_.join();
    }

    // In-flight rounds are bounded by the probe timeout
    for (auto& [id, future] : in_flight_) {
        if (future.valid()) {
            future.wait();
        }
    }
    in_flight_.clear();
    utils::log::info("Health monitor stopped");
}

void HealthMonitor::schedule_loop(std::stop_token stop, std::chrono::milliseconds interval) {
    constexpr std::chrono::milliseconds kSlice{100};

    while (!stop.stop_requested()) {
        // Sleep in short slices for responsive shutdown
        auto remaining = interval;
        while (remaining.count() > 0 && !stop.stop_requested()) {
            const auto step = std::min(remaining, kSlice);
            std::this_thread::sleep_for(step);
            remaining -= step;
        }

        if (stop.stop_requested()) break;

        dispatch_round();
    }
}

void HealthMonitor::dispatch_round() {
    for (const RegionConfig* region : catalog_.active_regions()) {
        auto& slot = in_flight_[region->id];
        if (slot.valid()) {
            if (slot.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
                continue;  // Previous round still running
            }
        }

        // Nothing may escape into the future: get() would rethrow on this thread
        slot = std::async(std::launch::async, [this, region] {
            try {
                check_region(*region);
            } catch (const std::exception& e) {
                utils::log::error(std::format("Health check for region {} failed: {}",
                                               region->id, e.what()));
            } catch (...) {
                utils::log::error(std::format("Health check for region {} failed: unknown exception",
                                               region->id));
            }
        });
    }
}

} // namespace regionrouter
