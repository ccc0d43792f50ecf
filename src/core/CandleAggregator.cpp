#include "core/CandleAggregator.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace core {
namespace {

domain::TimestampSec floor_div(domain::TimestampSec numerator, domain::TimestampSec denominator) noexcept {
    auto quotient = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --quotient;
    }
    return quotient;
}

domain::Candle close_bucket(domain::TimestampSec start, double open, double close) {
    return domain::Candle{start, open, close, domain::color_of(open, close)};
}

}  // namespace

domain::TimestampSec bucket_start(domain::TimestampSec timestamp, int cycle, int offset) noexcept {
    return floor_div(timestamp - offset, cycle) * cycle + offset;
}

std::string timeframe_label(int cycle, int offset) {
    std::ostringstream oss;
    oss << 'C' << cycle << '_' << std::setw(2) << std::setfill('0') << offset;
    return oss.str();
}

std::vector<domain::Candle> aggregate(const std::vector<domain::Tick>& ticks, int cycle, int offset) {
    if (cycle <= 0) {
        throw std::invalid_argument("aggregate: cycle must be positive");
    }
    if (offset < 0 || offset >= cycle) {
        throw std::invalid_argument("aggregate: offset must be in [0, cycle)");
    }

    std::vector<domain::Candle> candles;
    if (ticks.empty()) {
        return candles;
    }

    // Sort-key order implies non-decreasing timestamps, so each bucket is one contiguous run.
    domain::TimestampSec currentStart = bucket_start(ticks.front().timestamp, cycle, offset);
    double open = ticks.front().price;
    double close = open;

    for (std::size_t i = 1; i < ticks.size(); ++i) {
        const auto& tick = ticks[i];
        const auto start = bucket_start(tick.timestamp, cycle, offset);
        if (start != currentStart) {
            candles.push_back(close_bucket(currentStart, open, close));
            currentStart = start;
            open = tick.price;
        }
        close = tick.price;
    }
    candles.push_back(close_bucket(currentStart, open, close));

    return candles;
}

}  // namespace core
