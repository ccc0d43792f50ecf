#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace wsm::common {

struct Config {
    std::uint16_t port = 10000;
    wsm::log::Level logLevel = wsm::log::Level::Info;
    std::size_t threads = 1;

    std::string symbol = "R_100";
    std::string token;
    std::string appId = "1089";

    std::int64_t backfillDays = 2;
    std::size_t backfillWorkers = 5;

    int minCycle = 60;
    int maxCycle = 300;
    double minStrength = 70.0;
    double maxStrength = 100.0;

    std::int64_t lookbackHours = 4;
    std::int64_t passIntervalSec = 30;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace wsm::common
