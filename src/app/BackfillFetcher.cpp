#include "app/BackfillFetcher.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TickStore.hpp"

namespace app {
namespace {

constexpr std::size_t kProgressLogInterval = 50;

}  // namespace

std::vector<domain::TimeChunk> make_chunks(domain::TimestampSec start,
                                           domain::TimestampSec end,
                                           domain::TimestampSec maxSpan) {
    std::vector<domain::TimeChunk> chunks;
    if (start >= end || maxSpan <= 0) {
        return chunks;
    }

    chunks.reserve(static_cast<std::size_t>((end - start + maxSpan - 1) / maxSpan));
    for (auto chunkStart = start; chunkStart < end; chunkStart += maxSpan) {
        chunks.push_back(domain::TimeChunk{chunkStart, std::min(chunkStart + maxSpan, end)});
    }
    return chunks;
}

BackfillFetcher::BackfillFetcher(domain::IHistoryFetcher& fetcher,
                                 core::TickStore& store,
                                 const std::atomic<bool>& stopFlag,
                                 std::size_t workers)
    : fetcher_(fetcher), store_(store), stopFlag_(stopFlag), workers_(workers == 0 ? 1 : workers) {}

BackfillReport BackfillFetcher::run(const std::string& symbol,
                                    domain::TimestampSec start,
                                    domain::TimestampSec end) {
    BackfillReport report;
    const auto chunks = make_chunks(start, end);
    report.chunks = chunks.size();
    if (chunks.empty()) {
        LOG_INFO("BackfillFetcher: nothing to fetch for [" << start << ',' << end << ')');
        return report;
    }

    LOG_INFO("BackfillFetcher: starting symbol=" << symbol << " from=" << start << " to=" << end
                                                 << " chunks=" << chunks.size() << " workers=" << workers_);

    auto& metrics = wsm::common::metrics::Registry::instance();
    std::mutex reportMutex;
    boost::asio::thread_pool pool(workers_);

    for (const auto& chunk : chunks) {
        boost::asio::post(pool, [this, &symbol, chunk, &report, &reportMutex, &metrics]() {
            wsm::log::setThreadName("backfill");
            if (stopFlag_.load(std::memory_order_acquire)) {
                std::lock_guard<std::mutex> lock(reportMutex);
                ++report.skipped;
                return;
            }

            domain::FetchResult result = domain::FetchResult::success({});
            try {
                result = fetcher_.fetch_ticks(symbol, chunk);
            }
            catch (const std::exception& ex) {
                result = domain::FetchResult::failure(
                    domain::FetchError{domain::FetchError::Kind::Transport, ex.what()});
            }

            if (!result.ok()) {
                const auto& error = result.error();
                LOG_WARN("BackfillFetcher: chunk [" << chunk.start << ',' << chunk.end << ") degraded to empty ("
                                                    << domain::to_string(error.kind) << "): " << error.message);
                metrics.incrementCounter("backfill_chunks_failed_total");
                std::lock_guard<std::mutex> lock(reportMutex);
                ++report.failed;
                return;
            }

            const auto inserted = store_.insertBatch(result.value());
            metrics.incrementCounter("backfill_chunks_ok_total");

            std::lock_guard<std::mutex> lock(reportMutex);
            ++report.succeeded;
            report.ticksInserted += inserted;
            const auto done = report.succeeded + report.failed;
            if (done % kProgressLogInterval == 0) {
                LOG_INFO("BackfillFetcher: progress " << done << '/' << report.chunks
                                                      << " ticks=" << report.ticksInserted);
            }
        });
    }

    pool.join();

    LOG_INFO("BackfillFetcher: completed symbol=" << symbol << " ok=" << report.succeeded
                                                  << " failed=" << report.failed << " skipped=" << report.skipped
                                                  << " ticks=" << report.ticksInserted);
    return report;
}

}  // namespace app
