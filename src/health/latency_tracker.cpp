#include "health/latency_tracker.hpp"

#include <algorithm>
#include <cmath>

namespace regionrouter {

LatencyTracker::LatencyTracker(const std::vector<std::string>& region_ids, size_t capacity)
    : capacity_(capacity == 0 ? kDefaultCapacity : capacity) {
    windows_.reserve(region_ids.size());
    for (const auto& id : region_ids) {
        windows_.try_emplace(id, std::make_unique<Window>());
    }
}

const LatencyTracker::Window* LatencyTracker::find(const std::string& region_id) const {
    const auto it = windows_.find(region_id);
    return (it != windows_.end()) ? it->second.get() : nullptr;
}

bool LatencyTracker::record(const std::string& region_id, std::chrono::milliseconds latency) {
    const auto it = windows_.find(region_id);
    if (it == windows_.end()) return false;

    auto& window = *it->second;
    std::lock_guard lock(window.mutex);
    window.samples.push_back(latency);
    while (window.samples.size() > capacity_) {
        window.samples.pop_front();
    }
    return true;
}

std::optional<std::chrono::milliseconds> LatencyTracker::p95(const std::string& region_id) const {
    auto snapshot = samples(region_id);
    return percentile(snapshot, 0.95);
}

std::vector<std::chrono::milliseconds> LatencyTracker::samples(const std::string& region_id) const {
    const auto* window = find(region_id);
    if (!window) return {};

    std::lock_guard lock(window->mutex);
    return {window->samples.begin(), window->samples.end()};
}

size_t LatencyTracker::sample_count(const std::string& region_id) const {
    const auto* window = find(region_id);
    if (!window) return 0;

    std::lock_guard lock(window->mutex);
    return window->samples.size();
}

std::optional<std::chrono::milliseconds> LatencyTracker::percentile(
    std::vector<std::chrono::milliseconds>& samples, double q) {
    if (samples.empty()) return std::nullopt;

    std::sort(samples.begin(), samples.end());
    const auto index = static_cast<size_t>(std::floor(q * static_cast<double>(samples.size())));
    return samples[std::min(index, samples.size() - 1)];
}

} // namespace regionrouter
