#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace regionrouter {

/**
 * @brief Per-region bounded rolling window of probe latencies
 *
 * Each region owns a FIFO of the most recent `capacity` samples; the oldest
 * sample is evicted once the cap is exceeded. p95 sorts a snapshot copy
 * taken under the window lock, so reads never reorder shared state.
 *
 * The region key set is fixed at construction: samples for unknown regions
 * are rejected instead of creating new windows.
 */
class LatencyTracker {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit LatencyTracker(const std::vector<std::string>& region_ids,
                            size_t capacity = kDefaultCapacity);

    /**
     * @brief Append a sample, evicting the oldest beyond capacity
     * @return false if the region is unknown
     */
    bool record(const std::string& region_id, std::chrono::milliseconds latency);

    /**
     * @brief 95th percentile: sorted[floor(0.95 * n)]
     * @return nullopt when the window is empty or the region unknown
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> p95(const std::string& region_id) const;

    /// Snapshot of the window, oldest first
    [[nodiscard]] std::vector<std::chrono::milliseconds> samples(const std::string& region_id) const;

    [[nodiscard]] size_t sample_count(const std::string& region_id) const;

    [[nodiscard]] size_t capacity() const { return capacity_; }

    /**
     * @brief Percentile over an unsorted sample set (sorts in place)
     * @param q Quantile in [0, 1]
     */
    [[nodiscard]] static std::optional<std::chrono::milliseconds> percentile(
        std::vector<std::chrono::milliseconds>& samples, double q);

private:
    struct Window {
        mutable std::mutex mutex;
        std::deque<std::chrono::milliseconds> samples;
    };

    [[nodiscard]] const Window* find(const std::string& region_id) const;

    const size_t capacity_;
    std::unordered_map<std::string, std::unique_ptr<Window>> windows_;
};

} // namespace regionrouter
