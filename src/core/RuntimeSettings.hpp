#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "domain/Models.hpp"

namespace core {

// Partial update of the analysis bounds; absent fields keep their current value.
struct SettingsUpdate {
    std::optional<int> minCycle;
    std::optional<int> maxCycle;
    std::optional<double> minStrength;
    std::optional<double> maxStrength;
};

// Operator-mutable analysis configuration. Readers get a copy, so a pass keeps the
// values it started with.
class RuntimeSettings {
public:
    explicit RuntimeSettings(domain::AnalysisSettings initial);

    [[nodiscard]] domain::AnalysisSettings current() const;

    // Applies the update atomically. Throws std::invalid_argument and leaves the
    // settings untouched when the merged result is invalid.
    domain::AnalysisSettings apply(const SettingsUpdate& update);

    static void validate(const domain::AnalysisSettings& settings);

private:
    mutable std::mutex mutex_;
    domain::AnalysisSettings settings_;
};

}  // namespace core
