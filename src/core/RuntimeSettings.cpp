#include "core/RuntimeSettings.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"

namespace core {

RuntimeSettings::RuntimeSettings(domain::AnalysisSettings initial)
    : settings_(std::move(initial)) {
    validate(settings_);
}

domain::AnalysisSettings RuntimeSettings::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

domain::AnalysisSettings RuntimeSettings::apply(const SettingsUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto merged = settings_;
    if (update.minCycle) {
        merged.minCycle = *update.minCycle;
    }
    if (update.maxCycle) {
        merged.maxCycle = *update.maxCycle;
    }
    if (update.minStrength) {
        merged.minStrength = *update.minStrength;
    }
    if (update.maxStrength) {
        merged.maxStrength = *update.maxStrength;
    }

    validate(merged);
    settings_ = merged;

    LOG_INFO("RuntimeSettings updated cycles=[" << merged.minCycle << ',' << merged.maxCycle
                                                << "] strength=[" << merged.minStrength << ','
                                                << merged.maxStrength << ']');
    return merged;
}

void RuntimeSettings::validate(const domain::AnalysisSettings& settings) {
    if (settings.minCycle < 1) {
        throw std::invalid_argument("min_cycle must be >= 1");
    }
    if (settings.maxCycle < settings.minCycle) {
        throw std::invalid_argument("max_cycle must be >= min_cycle");
    }
    if (settings.maxCycle > domain::kMaxCycle) {
        throw std::invalid_argument("max_cycle must be <= " + std::to_string(domain::kMaxCycle));
    }
    if (!std::isfinite(settings.minStrength) || !std::isfinite(settings.maxStrength)) {
        throw std::invalid_argument("strength bounds must be finite");
    }
    if (settings.minStrength < 0.0 || settings.maxStrength > 100.0) {
        throw std::invalid_argument("strength bounds must be within [0, 100]");
    }
    if (settings.minStrength > settings.maxStrength) {
        throw std::invalid_argument("min_strength must be <= max_strength");
    }
}

}  // namespace core
