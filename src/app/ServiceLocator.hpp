#pragma once

#include <mutex>

namespace core {
class RuntimeSettings;
class TickStore;
}  // namespace core

namespace app {

class AnalysisScheduler;
class LiveSubscriber;

// Process-wide handles the HTTP controllers read from. Owners register on startup and
// clear before destruction.
class ServiceLocator {
public:
    static ServiceLocator& instance();

    void setScheduler(const AnalysisScheduler* scheduler);
    void setSettings(core::RuntimeSettings* settings);
    void setTickStore(const core::TickStore* store);
    void setLiveSubscriber(const LiveSubscriber* live);
    void reset();

    const AnalysisScheduler* scheduler() const;
    core::RuntimeSettings* settings() const;
    const core::TickStore* tickStore() const;
    const LiveSubscriber* liveSubscriber() const;

private:
    ServiceLocator() = default;

    mutable std::mutex mutex_;
    const AnalysisScheduler* scheduler_{nullptr};
    core::RuntimeSettings* settings_{nullptr};
    const core::TickStore* store_{nullptr};
    const LiveSubscriber* live_{nullptr};
};

}  // namespace app
