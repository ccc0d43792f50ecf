#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "domain/Models.hpp"

namespace wsm::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint16_t parsePort(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto portValue = std::stoul(value, &consumed);
        if (consumed != value.size() || portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + value);
    }
}

std::int64_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw std::out_of_range("must be >= 1");
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

int parseCycle(const std::string& value, const std::string& label) {
    const auto parsed = parsePositive(value, label);
    if (parsed > domain::kMaxCycle) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<int>(parsed);
}

double parseStrength(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed) || parsed < 0.0 || parsed > 100.0) {
            throw std::out_of_range("strength out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string parseNonEmpty(const std::string& value, const std::string& label) {
    auto trimmed = trim(value);
    if (trimmed.empty()) {
        throw std::runtime_error("Empty value for " + label);
    }
    return trimmed;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envPort = std::getenv("PORT")) {
        config.port = parsePort(envPort);
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = wsm::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envToken = std::getenv("DERIV_TOKEN")) {
        config.token = trim(envToken);
    }
    if (const char* envAppId = std::getenv("DERIV_APP_ID")) {
        config.appId = parseNonEmpty(envAppId, "DERIV_APP_ID");
    }
    if (const char* envSymbol = std::getenv("SYMBOL")) {
        config.symbol = parseNonEmpty(envSymbol, "SYMBOL");
    }

    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = wsm::log::levelFromString(toLower(levelArg));
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = static_cast<std::size_t>(parsePositive(threadsArg, "--threads"));
    }
    if (auto symbolArg = valueFromArgs(argc, argv, "--symbol"); !symbolArg.empty()) {
        config.symbol = parseNonEmpty(symbolArg, "--symbol");
    }
    if (auto tokenArg = valueFromArgs(argc, argv, "--token"); !tokenArg.empty()) {
        config.token = trim(tokenArg);
    }
    if (auto appIdArg = valueFromArgs(argc, argv, "--app-id"); !appIdArg.empty()) {
        config.appId = parseNonEmpty(appIdArg, "--app-id");
    }
    if (auto daysArg = valueFromArgs(argc, argv, "--backfill-days"); !daysArg.empty()) {
        config.backfillDays = parsePositive(daysArg, "--backfill-days");
    }
    if (auto workersArg = valueFromArgs(argc, argv, "--backfill-workers"); !workersArg.empty()) {
        config.backfillWorkers = static_cast<std::size_t>(parsePositive(workersArg, "--backfill-workers"));
    }
    if (auto minCycleArg = valueFromArgs(argc, argv, "--min-cycle"); !minCycleArg.empty()) {
        config.minCycle = parseCycle(minCycleArg, "--min-cycle");
    }
    if (auto maxCycleArg = valueFromArgs(argc, argv, "--max-cycle"); !maxCycleArg.empty()) {
        config.maxCycle = parseCycle(maxCycleArg, "--max-cycle");
    }
    if (auto minStrengthArg = valueFromArgs(argc, argv, "--min-strength"); !minStrengthArg.empty()) {
        config.minStrength = parseStrength(minStrengthArg, "--min-strength");
    }
    if (auto maxStrengthArg = valueFromArgs(argc, argv, "--max-strength"); !maxStrengthArg.empty()) {
        config.maxStrength = parseStrength(maxStrengthArg, "--max-strength");
    }
    if (auto lookbackArg = valueFromArgs(argc, argv, "--lookback-hours"); !lookbackArg.empty()) {
        config.lookbackHours = parsePositive(lookbackArg, "--lookback-hours");
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--pass-interval-sec"); !intervalArg.empty()) {
        config.passIntervalSec = parsePositive(intervalArg, "--pass-interval-sec");
    }

    if (config.maxCycle < config.minCycle) {
        throw std::runtime_error("--max-cycle must be >= --min-cycle");
    }
    if (config.maxStrength < config.minStrength) {
        throw std::runtime_error("--max-strength must be >= --min-strength");
    }

    LOG_INFO("Config: symbol=" << config.symbol << " app_id=" << config.appId << " port=" << config.port
                               << " cycles=" << config.minCycle << ".." << config.maxCycle
                               << " strength=" << config.minStrength << ".." << config.maxStrength
                               << " token=" << (config.token.empty() ? "none" : "set"));

    return config;
}

}  // namespace wsm::common
