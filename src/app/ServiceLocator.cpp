#include "app/ServiceLocator.hpp"

namespace app {

ServiceLocator& ServiceLocator::instance() {
    static ServiceLocator locator;
    return locator;
}

void ServiceLocator::setScheduler(const AnalysisScheduler* scheduler) {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_ = scheduler;
}

void ServiceLocator::setSettings(core::RuntimeSettings* settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

void ServiceLocator::setTickStore(const core::TickStore* store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = store;
}

void ServiceLocator::setLiveSubscriber(const LiveSubscriber* live) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_ = live;
}

void ServiceLocator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_ = nullptr;
    settings_ = nullptr;
    store_ = nullptr;
    live_ = nullptr;
}

const AnalysisScheduler* ServiceLocator::scheduler() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduler_;
}

core::RuntimeSettings* ServiceLocator::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

const core::TickStore* ServiceLocator::tickStore() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_;
}

const LiveSubscriber* ServiceLocator::liveSubscriber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

}  // namespace app
