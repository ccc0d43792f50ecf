#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "domain/feed/ITickFeed.hpp"

namespace core {
class TickStore;
}

namespace app {

constexpr domain::TimestampSec kMaxChunkSeconds = 600;
constexpr std::size_t kDefaultBackfillWorkers = 5;

struct BackfillReport {
    std::size_t chunks{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t ticksInserted{0};
};

// Contiguous half-open chunks covering [start, end), each at most maxSpan seconds long.
std::vector<domain::TimeChunk> make_chunks(domain::TimestampSec start,
                                           domain::TimestampSec end,
                                           domain::TimestampSec maxSpan = kMaxChunkSeconds);

class BackfillFetcher {
public:
    BackfillFetcher(domain::IHistoryFetcher& fetcher,
                    core::TickStore& store,
                    const std::atomic<bool>& stopFlag,
                    std::size_t workers = kDefaultBackfillWorkers);

    // Blocks until every chunk has been fetched, failed or skipped.
    BackfillReport run(const std::string& symbol, domain::TimestampSec start, domain::TimestampSec end);

private:
    domain::IHistoryFetcher& fetcher_;
    core::TickStore& store_;
    const std::atomic<bool>& stopFlag_;
    std::size_t workers_;
};

}  // namespace app
