#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names)
        : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.push_back(current ? std::string(current) : std::string());
            had_.push_back(current != nullptr);
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (had_[i]) {
                ::setenv(names_[i].c_str(), saved_[i].c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

private:
    std::vector<std::string> names_;
    std::vector<std::string> saved_;
    std::vector<bool> had_;
};

::wsm::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::wsm::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsRuntimeError(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard envGuard({"PORT", "LOG_LEVEL", "DERIV_TOKEN", "DERIV_APP_ID", "SYMBOL"});

    // Defaults when env and flags are absent.
    const auto defaults = runConfig({"app"});
    if (defaults.port != 10000 || defaults.symbol != "R_100" || defaults.appId != "1089" || !defaults.token.empty()
        || defaults.backfillDays != 2 || defaults.minCycle != 60 || defaults.maxCycle != 300
        || defaults.minStrength != 70.0 || defaults.maxStrength != 100.0 || defaults.lookbackHours != 4
        || defaults.passIntervalSec != 30 || defaults.backfillWorkers != 5) {
        std::cerr << "Unexpected default configuration\n";
        return 1;
    }

    // Environment overrides defaults.
    ::setenv("PORT", "8081", 1);
    ::setenv("DERIV_TOKEN", "abc123", 1);
    ::setenv("SYMBOL", "R_50", 1);
    ::setenv("LOG_LEVEL", "WARN", 1);
    const auto fromEnv = runConfig({"app"});
    if (fromEnv.port != 8081 || fromEnv.token != "abc123" || fromEnv.symbol != "R_50"
        || fromEnv.logLevel != wsm::log::Level::Warn) {
        std::cerr << "Environment values were not applied\n";
        return 1;
    }

    // Flags override the environment; both "--key value" and "--key=value" forms work.
    const auto fromFlags = runConfig({"app", "--port", "9000", "--symbol=R_25", "--min-cycle", "30", "--max-cycle=90",
                                      "--min-strength", "60.5", "--pass-interval-sec", "10", "--backfill-days=1"});
    if (fromFlags.port != 9000 || fromFlags.symbol != "R_25" || fromFlags.minCycle != 30 || fromFlags.maxCycle != 90
        || fromFlags.minStrength != 60.5 || fromFlags.passIntervalSec != 10 || fromFlags.backfillDays != 1
        || fromFlags.token != "abc123") {
        std::cerr << "Flag values were not applied\n";
        return 1;
    }

    if (!throwsRuntimeError({"app", "--port", "70000"}) || !throwsRuntimeError({"app", "--min-cycle", "0"})
        || !throwsRuntimeError({"app", "--min-cycle", "100", "--max-cycle", "50"})
        || !throwsRuntimeError({"app", "--max-cycle", "3601"})
        || !throwsRuntimeError({"app", "--max-strength", "101"})
        || !throwsRuntimeError({"app", "--backfill-workers", "x"})) {
        std::cerr << "Expected invalid flags to throw std::runtime_error\n";
        return 1;
    }

    return 0;
}
