#include <iostream>
#include <stdexcept>
#include <vector>

#include "core/CandleAggregator.hpp"
#include "domain/Models.hpp"

namespace {

std::vector<domain::Tick> ticksAt(const std::vector<std::pair<domain::TimestampSec, double>>& points) {
    std::vector<domain::Tick> ticks;
    std::int64_t seq = 0;
    for (const auto& [ts, price] : points) {
        ticks.push_back(domain::Tick{ts, price, domain::make_sort_key(ts, seq++)});
    }
    return ticks;
}

template <typename Fn>
bool throwsInvalidArgument(Fn&& fn) {
    try {
        fn();
    }
    catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    if (core::bucket_start(125, 60, 0) != 120 || core::bucket_start(125, 60, 30) != 90) {
        std::cerr << "Unexpected bucket start for timestamp 125\n";
        return 1;
    }
    if (core::bucket_start(-1, 60, 0) != -60 || core::bucket_start(5, 60, 30) != -30) {
        std::cerr << "Bucket start must floor for negative numerators\n";
        return 1;
    }

    if (core::timeframe_label(60, 5) != "C60_05" || core::timeframe_label(300, 123) != "C300_123") {
        std::cerr << "Unexpected timeframe labels: " << core::timeframe_label(60, 5) << ", "
                  << core::timeframe_label(300, 123) << "\n";
        return 1;
    }

    // Open is the first tick, close the last; empty buckets are absent.
    {
        const auto ticks = ticksAt({{0, 1.0}, {10, 1.5}, {59, 2.0}, {60, 5.0}, {119, 4.0}, {200, 3.0}});
        const auto candles = core::aggregate(ticks, 60, 0);
        const std::vector<domain::Candle> expected{
            {0, 1.0, 2.0, domain::CandleColor::Green},
            {60, 5.0, 4.0, domain::CandleColor::Red},
            {180, 3.0, 3.0, domain::CandleColor::Gray},
        };
        if (candles != expected) {
            std::cerr << "Unexpected candles for offset 0 (count=" << candles.size() << ")\n";
            return 1;
        }
        if (core::aggregate(ticks, 60, 0) != candles) {
            std::cerr << "aggregate is not deterministic\n";
            return 1;
        }
    }

    // Ticks sharing a second keep their sort-key order.
    {
        const auto ticks = ticksAt({{30, 2.0}, {30, 1.0}, {30, 3.0}});
        const auto candles = core::aggregate(ticks, 60, 30);
        if (candles.size() != 1U || candles[0].bucketStart != 30 || candles[0].open != 2.0
            || candles[0].close != 3.0) {
            std::cerr << "Unexpected candle for same-second ticks\n";
            return 1;
        }
    }

    if (!core::aggregate({}, 60, 0).empty()) {
        std::cerr << "Expected no candles without ticks\n";
        return 1;
    }

    if (!throwsInvalidArgument([]() { core::aggregate({}, 0, 0); })
        || !throwsInvalidArgument([]() { core::aggregate({}, 60, 60); })
        || !throwsInvalidArgument([]() { core::aggregate({}, 60, -1); })) {
        std::cerr << "Expected invalid cycle/offset to throw std::invalid_argument\n";
        return 1;
    }

    return 0;
}
