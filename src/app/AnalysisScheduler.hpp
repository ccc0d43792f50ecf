#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/SnapshotCache.hpp"
#include "domain/Models.hpp"

namespace core {
class RuntimeSettings;
class TickStore;
}  // namespace core

namespace app {

class AnalysisScheduler {
public:
    using Aggregator =
        std::function<std::vector<domain::Candle>(const std::vector<domain::Tick>&, int cycle, int offset)>;

    struct Options {
        std::chrono::seconds lookback{std::chrono::hours(4)};
        std::chrono::milliseconds cadence{std::chrono::seconds(30)};
        std::size_t minCandles{5};
        // Candle builder used by the grid scan; core::aggregate when empty.
        Aggregator aggregate;
    };

    using PriceProvider = std::function<std::optional<double>()>;

    AnalysisScheduler(core::TickStore& store,
                      core::RuntimeSettings& settings,
                      const std::atomic<bool>& stopFlag,
                      Options options);
    ~AnalysisScheduler();

    AnalysisScheduler(const AnalysisScheduler&) = delete;
    AnalysisScheduler& operator=(const AnalysisScheduler&) = delete;

    // Source of the live price; falls back to the newest stored tick when unset or empty.
    void setPriceProvider(PriceProvider provider);

    void setStatus(std::string status);
    [[nodiscard]] std::string status() const;

    // One full grid scan over the lookback window ending at nowSeconds. Never throws:
    // a failing pass yields an empty king list.
    domain::Snapshot runPass(domain::TimestampSec nowSeconds);

    void publish(domain::Snapshot snapshot);
    [[nodiscard]] std::shared_ptr<const domain::Snapshot> latestSnapshot() const;
    [[nodiscard]] std::uint64_t passes() const { return cache_.version(); }

    void start();
    void join();

    // Loops pass/publish/sleep on the calling thread until the stop flag is raised.
    void run();

private:
    std::vector<domain::King> scanGrid_(const domain::AnalysisSettings& settings,
                                        domain::TimestampSec nowSeconds) const;
    std::optional<double> currentPrice_() const;
    void sleepRemaining_(std::chrono::steady_clock::duration elapsed) const;

    core::TickStore& store_;
    core::RuntimeSettings& settings_;
    const std::atomic<bool>& stopFlag_;
    Options options_;

    mutable std::mutex mutex_;
    std::string status_{"Initializing..."};
    PriceProvider priceProvider_;

    core::SnapshotCache cache_;
    std::thread worker_;
};

}  // namespace app
