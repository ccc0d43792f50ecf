#include "core/StreakScorer.hpp"

#include <algorithm>
#include <cstring>

#include "core/CandleAggregator.hpp"

namespace core {
namespace {

struct RunState {
    domain::CandleColor color{domain::CandleColor::Gray};
    int length{0};

    void closeInto(domain::StreakHistogram& histogram) {
        if (length > 0 && color != domain::CandleColor::Gray) {
            ++histogram.forColor(color)[length];
        }
        color = domain::CandleColor::Gray;
        length = 0;
    }

    void start(domain::CandleColor newColor) {
        color = newColor;
        length = 1;
    }
};

void collect(const domain::RunLengthCounts& counts,
             domain::CandleColor color,
             const std::string& label,
             const StrengthBounds& bounds,
             std::vector<domain::King>& out) {
    for (const auto& [level, count] : counts) {
        const auto nextIt = counts.find(level + 1);
        const std::int64_t next = nextIt != counts.end() ? nextIt->second : 0;
        const auto value = strength(count, next);
        if (!value || !bounds.contains(*value)) {
            continue;
        }
        out.push_back(domain::King{label, color, level, count, next, *value});
    }
}

}  // namespace

domain::StreakHistogram build_histogram(const std::vector<domain::Candle>& candles, int cycle) {
    domain::StreakHistogram histogram;
    RunState run;

    for (std::size_t i = 0; i < candles.size(); ++i) {
        const auto& candle = candles[i];
        if (i > 0 && candle.bucketStart - candles[i - 1].bucketStart > cycle) {
            run.closeInto(histogram);
        }

        if (candle.color == domain::CandleColor::Gray) {
            run.closeInto(histogram);
            continue;
        }

        if (run.length > 0 && run.color == candle.color) {
            ++run.length;
        }
        else {
            run.closeInto(histogram);
            run.start(candle.color);
        }
    }
    run.closeInto(histogram);

    return histogram;
}

std::optional<double> strength(std::int64_t count, std::int64_t next) noexcept {
    if (count <= 0) {
        return std::nullopt;
    }
    return (1.0 - static_cast<double>(next) / static_cast<double>(count)) * 100.0;
}

std::vector<domain::King> score(const std::vector<domain::Candle>& candles,
                                int cycle,
                                int offset,
                                const StrengthBounds& bounds,
                                std::size_t minCandles) {
    std::vector<domain::King> candidates;
    if (candles.size() < minCandles) {
        return candidates;
    }

    const auto histogram = build_histogram(candles, cycle);
    const auto label = timeframe_label(cycle, offset);
    collect(histogram.red, domain::CandleColor::Red, label, bounds, candidates);
    collect(histogram.green, domain::CandleColor::Green, label, bounds, candidates);
    return candidates;
}

bool KingBoard::offer(const domain::King& candidate) {
    const auto key = std::make_pair(candidate.color, candidate.level);
    auto it = kings_.find(key);
    if (it == kings_.end()) {
        kings_.emplace(key, candidate);
        return true;
    }
    if (candidate.strength > it->second.strength) {
        it->second = candidate;
        return true;
    }
    return false;
}

std::vector<domain::King> KingBoard::sorted() const {
    std::vector<domain::King> result;
    result.reserve(kings_.size());
    for (const auto& entry : kings_) {
        result.push_back(entry.second);
    }

    std::stable_sort(result.begin(), result.end(), [](const domain::King& lhs, const domain::King& rhs) {
        if (lhs.level != rhs.level) {
            return lhs.level < rhs.level;
        }
        return std::strcmp(domain::color_name(lhs.color), domain::color_name(rhs.color)) < 0;
    });
    return result;
}

}  // namespace core
