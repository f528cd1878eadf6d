#pragma once

#include "health/ihealth_probe.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace regionrouter::testing {

/**
 * @brief Scriptable health probe keyed by deployment URL + path
 *
 * Unscripted endpoints answer 200 in 10ms. A scripted endpoint returns its
 * response every time until changed.
 */
class MockHealthProbe : public IHealthProbe {
public:
    struct ForeignError {};

    struct Response {
        bool responded = true;
        int status = 200;
        std::chrono::milliseconds latency{10};
        bool throws = false;
        bool throws_foreign = false;            // Throws a type outside std::exception
        std::chrono::milliseconds delay{0};     // Real sleep before answering
    };

    [[nodiscard]] ProbeResult probe(const std::string& base_url,
                                    const HealthEndpoint& endpoint,
                                    std::chrono::milliseconds /*timeout*/) override {
        probe_count_.fetch_add(1, std::memory_order_relaxed);

        Response response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(base_url + endpoint.path);
            const auto it = responses_.find(base_url + endpoint.path);
            if (it != responses_.end()) {
                response = it->second;
            }
        }

        if (response.delay.count() > 0) {
            std::this_thread::sleep_for(response.delay);
        }
        if (response.throws) {
            throw std::runtime_error("mock probe exploded");
        }
        if (response.throws_foreign) {
            throw ForeignError{};
        }

        ProbeResult result;
        result.responded = response.responded;
        if (response.responded) {
            result.status = response.status;
            result.latency = response.latency;
        } else {
            result.error = "connection refused (mock)";
        }
        return result;
    }

    void set_response(const std::string& url_and_path, Response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url_and_path] = response;
    }

    void set_status(const std::string& url_and_path, int status) {
        Response response;
        response.status = status;
        set_response(url_and_path, response);
    }

    void set_down(const std::string& url_and_path) {
        Response response;
        response.responded = false;
        set_response(url_and_path, response);
    }

    void set_up(const std::string& url_and_path) {
        set_response(url_and_path, Response{});
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] uint64_t probe_count() const {
        return probe_count_.load(std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Response> responses_;
    std::vector<std::string> calls_;
    std::atomic<uint64_t> probe_count_{0};
};

} // namespace regionrouter::testing
