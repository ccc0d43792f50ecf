#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include "adapters/deriv/DerivConnection.hpp"
#include "adapters/deriv/DerivHistoryClient.hpp"
#include "adapters/deriv/DerivLiveClient.hpp"
#include "api/HttpServer.hpp"
#include "app/AnalysisScheduler.hpp"
#include "app/BackfillFetcher.hpp"
#include "app/LiveSubscriber.hpp"
#include "app/ServiceLocator.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/TickStore.hpp"

namespace {

constexpr std::chrono::milliseconds kFetchTimeout{10000};
constexpr std::int64_t kSecondsPerDay = 86400;

std::atomic<bool> gStopRequested{false};
volatile std::sig_atomic_t gSignalStatus = 0;

// Raises the stop flag on scope exit so worker threads wind down on early returns.
struct StopOnExit {
    std::atomic<bool>& flag;
    ~StopOnExit() { flag.store(true); }
};

void handleSignal(int signal) {
    gSignalStatus = signal;
    gStopRequested.store(true);
}

domain::TimestampSec nowEpochSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    wsm::log::setThreadName("main");

    try {
        auto config = wsm::common::Config::fromArgs(argc, argv);
        wsm::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Port: " << config.port);
        LOG_INFO("  Log level: " << wsm::log::levelToString(config.logLevel));
        LOG_INFO("  HTTP threads: " << config.threads);
        LOG_INFO("  Backfill: " << config.backfillDays << " day(s), " << config.backfillWorkers << " worker(s)");
        LOG_INFO("  Analysis: lookback=" << config.lookbackHours << "h cadence=" << config.passIntervalSec << "s");

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        core::TickStore store;
        core::RuntimeSettings settings(domain::AnalysisSettings{
            config.symbol, config.minCycle, config.maxCycle, config.minStrength, config.maxStrength});
        std::unique_ptr<adapters::deriv::DerivLiveClient> liveClient;
        std::unique_ptr<app::LiveSubscriber> live;

        app::AnalysisScheduler::Options schedulerOptions;
        schedulerOptions.lookback = std::chrono::hours(config.lookbackHours);
        schedulerOptions.cadence = std::chrono::seconds(config.passIntervalSec);
        app::AnalysisScheduler scheduler(store, settings, gStopRequested, schedulerOptions);
        StopOnExit stopOnExit{gStopRequested};
        scheduler.setStatus("Backfilling...");

        auto& locator = app::ServiceLocator::instance();
        locator.setTickStore(&store);
        locator.setSettings(&settings);
        locator.setScheduler(&scheduler);

        wsm::api::Endpoint httpEndpoint{"0.0.0.0", config.port};
        wsm::api::HttpServer server(httpEndpoint, config.threads);
        server.start();

        scheduler.start();

        adapters::deriv::Endpoint upstream;
        upstream.appId = config.appId;

        {
            adapters::deriv::DerivHistoryClient history(upstream, config.token, kFetchTimeout);
            app::BackfillFetcher backfill(history, store, gStopRequested, config.backfillWorkers);
            const auto end = nowEpochSeconds();
            const auto start = end - config.backfillDays * kSecondsPerDay;
            const auto report = backfill.run(config.symbol, start, end);
            LOG_INFO("Backfill finished: chunks=" << report.chunks << " ok=" << report.succeeded
                                                  << " failed=" << report.failed << " skipped=" << report.skipped
                                                  << " inserted=" << report.ticksInserted);
        }

        if (!gStopRequested.load()) {
            scheduler.setStatus("Active");
            liveClient = std::make_unique<adapters::deriv::DerivLiveClient>(upstream);
            live = std::make_unique<app::LiveSubscriber>(
                *liveClient, store, gStopRequested, config.symbol, config.token);
            scheduler.setPriceProvider([subscriber = live.get()]() { return subscriber->latestPrice(); });
            locator.setLiveSubscriber(live.get());
            live->start();
            LOG_INFO("Live subscription started symbol=" << config.symbol);
        }

        while (!gStopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Signal " << gSignalStatus << " received, stopping services...");

        if (live) {
            live->stop();
        }
        scheduler.join();
        server.stop();

        locator.reset();
        scheduler.setPriceProvider(nullptr);
        live.reset();
        liveClient.reset();

        LOG_INFO("Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
