#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace domain {

using TimestampSec = std::int64_t;
using SortKey = std::int64_t;

// Multiplier separating the second from the intra-second sequence inside a sort key.
constexpr std::int64_t kSortKeyScale = 100'000;

struct Tick {
    TimestampSec timestamp{0};
    double price{0.0};
    SortKey sortKey{0};
};

inline SortKey make_sort_key(TimestampSec timestamp, std::int64_t sequence = 0) noexcept {
    return timestamp * kSortKeyScale + sequence;
}

inline Tick make_live_tick(TimestampSec timestamp, double price) noexcept {
    return Tick{timestamp, price, make_sort_key(timestamp)};
}

enum class CandleColor {
    Red,
    Green,
    Gray,
};

inline const char* color_name(CandleColor color) noexcept {
    switch (color) {
    case CandleColor::Red:
        return "Red";
    case CandleColor::Green:
        return "Green";
    case CandleColor::Gray:
    default:
        break;
    }
    return "Gray";
}

inline CandleColor color_of(double open, double close) noexcept {
    if (close < open) {
        return CandleColor::Red;
    }
    if (close > open) {
        return CandleColor::Green;
    }
    return CandleColor::Gray;
}

struct Candle {
    TimestampSec bucketStart{0};
    double open{0.0};
    double close{0.0};
    CandleColor color{CandleColor::Gray};

    bool operator==(const Candle& other) const noexcept {
        return bucketStart == other.bucketStart && open == other.open && close == other.close
            && color == other.color;
    }
    bool operator!=(const Candle& other) const noexcept { return !(*this == other); }
};

// Run length -> number of runs of exactly that length.
using RunLengthCounts = std::map<int, std::int64_t>;

struct StreakHistogram {
    RunLengthCounts red;
    RunLengthCounts green;

    RunLengthCounts& forColor(CandleColor color) { return color == CandleColor::Red ? red : green; }
    const RunLengthCounts& forColor(CandleColor color) const {
        return color == CandleColor::Red ? red : green;
    }
};

struct King {
    std::string timeframe;
    CandleColor color{CandleColor::Green};
    int level{0};
    std::int64_t currCount{0};
    std::int64_t nextCount{0};
    double strength{0.0};
};

// Longest candle the grid scan accepts; one hour leaves four candles in the
// default lookback.
inline constexpr int kMaxCycle = 3600;

struct AnalysisSettings {
    std::string symbol;
    int minCycle{60};
    int maxCycle{300};
    double minStrength{70.0};
    double maxStrength{100.0};
};

struct Snapshot {
    std::string status;
    std::string lastUpdate;
    double price{0.0};
    std::vector<King> kings;
    AnalysisSettings config;
};

}  // namespace domain
