#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/AnalysisScheduler.hpp"
#include "common/Metrics.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/TickStore.hpp"

namespace {
using namespace std::chrono_literals;

constexpr domain::TimestampSec kNow = 6'000'000;

// Three ticks per minute; minutes follow Green, Green, Red on the 60 second grid.
void fillPattern(core::TickStore& store, domain::TimestampSec from, domain::TimestampSec to) {
    for (auto ts = from; ts < to; ts += 20) {
        const auto minute = (ts - from) / 60;
        const auto step = static_cast<double>(((ts - from) % 60) / 20);
        const bool green = minute % 3 != 2;
        store.insertOne(domain::make_live_tick(ts, 100.0 + (green ? step : -step)));
    }
}

const domain::King* findKing(const domain::Snapshot& snapshot, domain::CandleColor color, int level) {
    for (const auto& king : snapshot.kings) {
        if (king.color == color && king.level == level) {
            return &king;
        }
    }
    return nullptr;
}

}  // namespace

int main() {
    core::TickStore store;
    fillPattern(store, kNow - 3600, kNow);

    core::RuntimeSettings settings(domain::AnalysisSettings{"R_100", 60, 60, 0.0, 100.0});
    std::atomic<bool> stop{false};
    app::AnalysisScheduler::Options options;
    options.cadence = 50ms;
    app::AnalysisScheduler scheduler(store, settings, stop, options);

    if (scheduler.latestSnapshot()->status != "Initializing..." || !scheduler.latestSnapshot()->kings.empty()) {
        std::cerr << "Expected an empty initial snapshot\n";
        return 1;
    }

    scheduler.setStatus("Backfilling...");
    const auto snapshot = scheduler.runPass(kNow);

    if (snapshot.status != "Backfilling..." || snapshot.config.symbol != "R_100" || snapshot.config.minCycle != 60) {
        std::cerr << "Snapshot does not carry status and config\n";
        return 1;
    }
    if (snapshot.lastUpdate.size() != 19U || snapshot.lastUpdate[4] != '-' || snapshot.lastUpdate[10] != ' ') {
        std::cerr << "Unexpected last update format: " << snapshot.lastUpdate << "\n";
        return 1;
    }
    if (snapshot.price != 98.0) {
        std::cerr << "Expected the newest stored price 98.0, got " << snapshot.price << "\n";
        return 1;
    }

    const auto* green2 = findKing(snapshot, domain::CandleColor::Green, 2);
    const auto* red1 = findKing(snapshot, domain::CandleColor::Red, 1);
    if (!green2 || green2->timeframe != "C60_00" || green2->currCount != 20 || green2->nextCount != 0
        || green2->strength != 100.0) {
        std::cerr << "Expected Green level 2 from C60_00 with 20 runs\n";
        return 1;
    }
    if (!red1 || red1->timeframe != "C60_00" || red1->currCount != 20) {
        std::cerr << "Expected Red level 1 from C60_00 with 20 runs\n";
        return 1;
    }
    for (std::size_t i = 1; i < snapshot.kings.size(); ++i) {
        if (snapshot.kings[i - 1].level > snapshot.kings[i].level) {
            std::cerr << "Kings are not ordered by level\n";
            return 1;
        }
    }

    // Bounds changes apply to the next pass.
    settings.apply(core::SettingsUpdate{std::nullopt, std::nullopt, 100.0, std::nullopt});
    const auto strict = scheduler.runPass(kNow);
    for (const auto& king : strict.kings) {
        if (king.strength < 100.0) {
            std::cerr << "Strength floor not applied on the next pass\n";
            return 1;
        }
    }

    // Ticks older than the lookback are ignored.
    if (!scheduler.runPass(kNow + 6 * 3600).kings.empty()) {
        std::cerr << "Expected no kings once the ticks fall out of the lookback window\n";
        return 1;
    }

    // The live price wins over the stored one when present.
    scheduler.setPriceProvider([]() -> std::optional<double> { return 42.5; });
    if (scheduler.runPass(kNow).price != 42.5) {
        std::cerr << "Expected the live price in the snapshot\n";
        return 1;
    }
    scheduler.setPriceProvider([]() -> std::optional<double> { return std::nullopt; });
    if (scheduler.runPass(kNow).price != 98.0) {
        std::cerr << "Expected the stored price when no live price is known\n";
        return 1;
    }

    // A failing pass publishes no kings but still carries status, price and config.
    {
        app::AnalysisScheduler::Options failing;
        failing.aggregate = [](const std::vector<domain::Tick>&, int, int) -> std::vector<domain::Candle> {
            throw std::runtime_error("aggregation failed");
        };
        app::AnalysisScheduler broken(store, settings, stop, failing);
        broken.setStatus("Active");

        auto& registry = wsm::common::metrics::Registry::instance();
        const auto failuresBefore = registry.snapshot().counter("analysis_pass_failures_total");
        broken.publish(broken.runPass(kNow));

        const auto published = broken.latestSnapshot();
        if (!published->kings.empty() || published->status != "Active" || published->price != 98.0
            || published->config.minCycle != 60) {
            std::cerr << "Expected an empty king list with status and price after a failed pass\n";
            return 1;
        }
        if (registry.snapshot().counter("analysis_pass_failures_total") != failuresBefore + 1U) {
            std::cerr << "Expected the pass failure counter to advance\n";
            return 1;
        }
        if (registry.snapshot().gauge("kings_count") != 0.0) {
            std::cerr << "Expected kings_count to drop to zero after a failed pass\n";
            return 1;
        }
    }

    // The loop publishes on its cadence and exits promptly on stop.
    const auto passesBefore = wsm::common::metrics::Registry::instance().snapshot().counter("analysis_passes_total");
    scheduler.setStatus("Active");
    scheduler.start();
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (scheduler.passes() < 2U && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    stop.store(true);
    scheduler.join();

    if (scheduler.passes() < 2U) {
        std::cerr << "Expected at least two published passes, got " << scheduler.passes() << "\n";
        return 1;
    }
    if (scheduler.latestSnapshot()->status != "Active") {
        std::cerr << "Expected the published status to be Active\n";
        return 1;
    }
    if (wsm::common::metrics::Registry::instance().snapshot().counter("analysis_passes_total") <= passesBefore) {
        std::cerr << "Expected the pass counter to advance\n";
        return 1;
    }

    return 0;
}
