#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace wsm::common::metrics {

class Registry {
public:
    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, std::uint64_t> routes;
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, GaugeSnapshot> gauges;

        [[nodiscard]] std::uint64_t counter(const std::string& key) const;
        [[nodiscard]] double gauge(const std::string& key) const;
    };

    // Records the elapsed wall time in milliseconds into a gauge when destroyed.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string gaugeKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

        [[nodiscard]] std::chrono::milliseconds elapsed() const;

    private:
        std::string gaugeKey_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementRequest(const std::string& routeKey);
    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    Snapshot snapshot() const;

private:
    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> routes_;
    std::map<std::string, std::uint64_t> counters_;
    std::map<std::string, GaugeMetrics> gauges_;
};

}  // namespace wsm::common::metrics
