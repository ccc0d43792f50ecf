#include "common/Metrics.hpp"

#include <utility>

namespace wsm::common::metrics {

std::uint64_t Registry::Snapshot::counter(const std::string& key) const {
    const auto it = counters.find(key);
    return it != counters.end() ? it->second : 0U;
}

double Registry::Snapshot::gauge(const std::string& key) const {
    const auto it = gauges.find(key);
    return it != gauges.end() ? it->second.value : 0.0;
}

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string gaugeKey)
    : gaugeKey_(std::move(gaugeKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    Registry::instance().setGauge(gaugeKey_, duration.count());
}

std::chrono::milliseconds Registry::ScopedTimer::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
}

void Registry::incrementRequest(const std::string& routeKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++routes_[routeKey];
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
    if (value == 0.0) {
        if (!gauge.zeroSince.has_value()) {
            gauge.zeroSince = now;
        }
    }
    else {
        gauge.zeroSince.reset();
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.routes = routes_;
    snapshot.counters = counters_;
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt, gauge.zeroSince});
    }
    return snapshot;
}

}  // namespace wsm::common::metrics
