#pragma once

#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace core {

// Floor-aligned bucket start for a timestamp on a (cycle, offset) grid.
domain::TimestampSec bucket_start(domain::TimestampSec timestamp, int cycle, int offset) noexcept;

// "C<cycle>_<offset>" with the offset padded to two digits.
std::string timeframe_label(int cycle, int offset);

// Builds open/close candles from ticks ordered by sort key. Buckets without ticks are
// not emitted. Throws std::invalid_argument for cycle <= 0 or offset outside [0, cycle).
std::vector<domain::Candle> aggregate(const std::vector<domain::Tick>& ticks, int cycle, int offset);

}  // namespace core
