#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "domain/Models.hpp"

namespace core {

class SnapshotCache {
public:
    SnapshotCache();
    explicit SnapshotCache(std::shared_ptr<const domain::Snapshot> initial);

    void update(std::shared_ptr<const domain::Snapshot> snapshot);
    std::shared_ptr<const domain::Snapshot> snapshot() const;
    std::uint64_t version() const;

private:
    static std::shared_ptr<const domain::Snapshot> ensureValid(
        std::shared_ptr<const domain::Snapshot> snapshot);

    mutable std::shared_ptr<const domain::Snapshot> ptr_;
    std::atomic<std::uint64_t> ver_{0};
};

}  // namespace core
