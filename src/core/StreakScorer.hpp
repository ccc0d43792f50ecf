#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "domain/Models.hpp"

namespace core {

constexpr std::size_t kDefaultMinCandles = 5;

struct StrengthBounds {
    double min{0.0};
    double max{100.0};

    bool contains(double value) const noexcept { return value >= min && value <= max; }
};

domain::StreakHistogram build_histogram(const std::vector<domain::Candle>& candles, int cycle);

// Share of runs of a length that did not extend by one more candle, in percent.
std::optional<double> strength(std::int64_t count, std::int64_t next) noexcept;

// Candidates for one (cycle, offset) scan, ordered by color then level.
std::vector<domain::King> score(const std::vector<domain::Candle>& candles,
                                int cycle,
                                int offset,
                                const StrengthBounds& bounds,
                                std::size_t minCandles = kDefaultMinCandles);

// Best candidate per (color, level) across one analysis pass.
class KingBoard {
public:
    // Replaces the held king only when the candidate is strictly stronger.
    bool offer(const domain::King& candidate);

    [[nodiscard]] std::vector<domain::King> sorted() const;
    [[nodiscard]] std::size_t size() const noexcept { return kings_.size(); }

private:
    std::map<std::pair<domain::CandleColor, int>, domain::King> kings_;
};

}  // namespace core
