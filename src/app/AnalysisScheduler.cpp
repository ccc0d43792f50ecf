#include "app/AnalysisScheduler.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/CandleAggregator.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/StreakScorer.hpp"
#include "core/TickStore.hpp"

namespace app {
namespace {

constexpr std::chrono::milliseconds kStopPoll{200};

std::string formatUtc(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

domain::TimestampSec nowEpochSeconds() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

}  // namespace

AnalysisScheduler::AnalysisScheduler(core::TickStore& store,
                                     core::RuntimeSettings& settings,
                                     const std::atomic<bool>& stopFlag,
                                     Options options)
    : store_(store), settings_(settings), stopFlag_(stopFlag), options_(std::move(options)) {}

AnalysisScheduler::~AnalysisScheduler() {
    join();
}

void AnalysisScheduler::setPriceProvider(PriceProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    priceProvider_ = std::move(provider);
}

void AnalysisScheduler::setStatus(std::string status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = std::move(status);
}

std::string AnalysisScheduler::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::vector<domain::King> AnalysisScheduler::scanGrid_(const domain::AnalysisSettings& settings,
                                                       domain::TimestampSec nowSeconds) const {
    const auto ticks = store_.rangeSince(nowSeconds - options_.lookback.count());
    const core::StrengthBounds bounds{settings.minStrength, settings.maxStrength};

    core::KingBoard board;
    for (int cycle = settings.minCycle; cycle <= settings.maxCycle; ++cycle) {
        for (int offset = 0; offset < cycle; ++offset) {
            const auto candles = options_.aggregate ? options_.aggregate(ticks, cycle, offset)
                                                    : core::aggregate(ticks, cycle, offset);
            for (const auto& candidate : core::score(candles, cycle, offset, bounds, options_.minCandles)) {
                board.offer(candidate);
            }
        }
        if (stopFlag_.load(std::memory_order_acquire)) {
            LOG_INFO("AnalysisScheduler: stop requested mid-pass at cycle=" << cycle);
            break;
        }
    }
    return board.sorted();
}

domain::Snapshot AnalysisScheduler::runPass(domain::TimestampSec nowSeconds) {
    auto& metrics = wsm::common::metrics::Registry::instance();
    const auto settings = settings_.current();

    domain::Snapshot snapshot;
    snapshot.config = settings;
    snapshot.status = status();

    {
        wsm::common::metrics::Registry::ScopedTimer timer("analysis_pass_ms");
        try {
            snapshot.kings = scanGrid_(settings, nowSeconds);
        }
        catch (const std::exception& ex) {
            LOG_WARN("AnalysisScheduler: pass failed, publishing empty kings: " << ex.what());
            metrics.incrementCounter("analysis_pass_failures_total");
            snapshot.kings.clear();
        }
    }

    snapshot.price = currentPrice_().value_or(0.0);
    snapshot.lastUpdate = formatUtc(std::chrono::system_clock::now());

    metrics.incrementCounter("analysis_passes_total");
    metrics.setGauge("kings_count", static_cast<double>(snapshot.kings.size()));
    return snapshot;
}

void AnalysisScheduler::publish(domain::Snapshot snapshot) {
    cache_.update(std::make_shared<const domain::Snapshot>(std::move(snapshot)));
}

std::shared_ptr<const domain::Snapshot> AnalysisScheduler::latestSnapshot() const {
    return cache_.snapshot();
}

void AnalysisScheduler::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this]() {
        wsm::log::setThreadName("analysis");
        try {
            LOG_INFO("AnalysisScheduler thread starting");
            run();
            LOG_INFO("AnalysisScheduler thread finished cleanly");
        }
        catch (const std::exception& ex) {
            LOG_ERR("AnalysisScheduler thread crashed: " << ex.what());
        }
    });
}

void AnalysisScheduler::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AnalysisScheduler::run() {
    while (!stopFlag_.load(std::memory_order_acquire)) {
        const auto started = std::chrono::steady_clock::now();
        auto snapshot = runPass(nowEpochSeconds());
        LOG_INFO("AnalysisScheduler: pass complete kings=" << snapshot.kings.size() << " ticks=" << store_.count()
                                                           << " status=" << snapshot.status);
        publish(std::move(snapshot));
        sleepRemaining_(std::chrono::steady_clock::now() - started);
    }
}

std::optional<double> AnalysisScheduler::currentPrice_() const {
    PriceProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = priceProvider_;
    }
    if (provider) {
        if (auto price = provider()) {
            return price;
        }
    }
    return store_.latestPrice();
}

void AnalysisScheduler::sleepRemaining_(std::chrono::steady_clock::duration elapsed) const {
    if (elapsed >= options_.cadence) {
        return;
    }
    const auto deadline = std::chrono::steady_clock::now() + (options_.cadence - elapsed);
    while (!stopFlag_.load(std::memory_order_acquire)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(kStopPoll, remaining + std::chrono::milliseconds(1)));
    }
}

}  // namespace app
