#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "domain/Models.hpp"

namespace core {

// Deduplicated tick history ordered by sort key. Writers are serialized; readers
// copy out a consistent range under a shared lock.
class TickStore {
public:
    TickStore() = default;

    TickStore(const TickStore&) = delete;
    TickStore& operator=(const TickStore&) = delete;

    std::size_t insertBatch(const std::vector<domain::Tick>& ticks);
    bool insertOne(const domain::Tick& tick);

    [[nodiscard]] std::vector<domain::Tick> rangeSince(domain::TimestampSec minTimestamp) const;
    [[nodiscard]] std::optional<double> latestPrice() const;
    [[nodiscard]] std::size_t count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<domain::SortKey, domain::Tick> ticks_;
};

}  // namespace core
