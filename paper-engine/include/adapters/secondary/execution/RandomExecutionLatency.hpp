#pragma once

#include "ports/output/IExecutionLatency.hpp"
#include <algorithm>
#include <mutex>
#include <random>
#include <thread>

namespace paper::adapters::secondary {

/**
 * @brief Случайная задержка исполнения, равномерно в [min, max]
 */
class RandomExecutionLatency : public ports::output::IExecutionLatency {
public:
    RandomExecutionLatency(std::chrono::milliseconds min, std::chrono::milliseconds max)
        : min_(std::min(min, max))
        , max_(std::max(min, max))
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<long long> dist(min_.count(), max_.count());
        return std::chrono::milliseconds(dist(rng_));
    }

    void wait(std::chrono::milliseconds delay) override {
        std::this_thread::sleep_for(delay);
    }

private:
    std::chrono::milliseconds min_;
    std::chrono::milliseconds max_;
    std::mutex mutex_;
    std::mt19937 rng_;
};

} // namespace paper::adapters::secondary
