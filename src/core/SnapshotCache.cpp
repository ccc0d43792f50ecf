#include "core/SnapshotCache.hpp"

#include <utility>

namespace {
std::shared_ptr<const domain::Snapshot> makeEmptySnapshot() {
    auto empty = std::make_shared<domain::Snapshot>();
    empty->status = "Initializing...";
    return empty;
}
}  // namespace

namespace core {

std::shared_ptr<const domain::Snapshot> SnapshotCache::ensureValid(
    std::shared_ptr<const domain::Snapshot> snapshot) {
    if (snapshot) {
        return snapshot;
    }
    return makeEmptySnapshot();
}

SnapshotCache::SnapshotCache()
    : ptr_(makeEmptySnapshot()) {}

SnapshotCache::SnapshotCache(std::shared_ptr<const domain::Snapshot> initial)
    : ptr_(ensureValid(std::move(initial))) {}

void SnapshotCache::update(std::shared_ptr<const domain::Snapshot> snapshot) {
    auto safePtr = ensureValid(std::move(snapshot));
    std::atomic_store_explicit(&ptr_, safePtr, std::memory_order_release);
    ver_.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<const domain::Snapshot> SnapshotCache::snapshot() const {
    auto current = std::atomic_load_explicit(&ptr_, std::memory_order_acquire);
    return ensureValid(current);
}

std::uint64_t SnapshotCache::version() const {
    return ver_.load(std::memory_order_relaxed);
}

}  // namespace core
