#include "core/TickStore.hpp"

#include <mutex>

#include "common/Metrics.hpp"

namespace core {

std::size_t TickStore::insertBatch(const std::vector<domain::Tick>& ticks) {
    if (ticks.empty()) {
        return 0;
    }

    std::size_t inserted = 0;
    std::size_t total = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& tick : ticks) {
            if (ticks_.emplace(tick.sortKey, tick).second) {
                ++inserted;
            }
        }
        total = ticks_.size();
    }

    auto& metrics = wsm::common::metrics::Registry::instance();
    metrics.incrementCounter("ticks_inserted_total", inserted);
    metrics.setGauge("tick_store_size", static_cast<double>(total));
    return inserted;
}

bool TickStore::insertOne(const domain::Tick& tick) {
    bool inserted = false;
    std::size_t total = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        inserted = ticks_.emplace(tick.sortKey, tick).second;
        total = ticks_.size();
    }

    if (inserted) {
        auto& metrics = wsm::common::metrics::Registry::instance();
        metrics.incrementCounter("ticks_inserted_total");
        metrics.setGauge("tick_store_size", static_cast<double>(total));
    }
    return inserted;
}

std::vector<domain::Tick> TickStore::rangeSince(domain::TimestampSec minTimestamp) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<domain::Tick> result;
    auto it = ticks_.lower_bound(domain::make_sort_key(minTimestamp));
    for (; it != ticks_.end(); ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::optional<double> TickStore::latestPrice() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (ticks_.empty()) {
        return std::nullopt;
    }
    return ticks_.rbegin()->second.price;
}

std::size_t TickStore::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ticks_.size();
}

}  // namespace core
