#include "app/LiveSubscriber.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TickStore.hpp"

namespace app {
namespace {

constexpr std::chrono::milliseconds kStopPoll{200};

}  // namespace

LiveSubscriber::LiveSubscriber(domain::ILiveTickSource& source,
                               core::TickStore& store,
                               const std::atomic<bool>& stopFlag,
                               std::string symbol,
                               std::string token,
                               std::chrono::milliseconds backoff)
    : source_(source),
      store_(store),
      stopFlag_(stopFlag),
      symbol_(std::move(symbol)),
      token_(std::move(token)),
      backoff_(backoff) {}

LiveSubscriber::~LiveSubscriber() {
    stop();
}

void LiveSubscriber::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this]() {
        wsm::log::setThreadName("live");
        try {
            LOG_INFO("LiveSubscriber thread starting symbol=" << symbol_);
            run();
            LOG_INFO("LiveSubscriber thread finished cleanly");
        }
        catch (const std::exception& ex) {
            LOG_ERR("LiveSubscriber thread crashed: " << ex.what());
        }
    });
}

void LiveSubscriber::stop() {
    source_.cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void LiveSubscriber::run() {
    auto& metrics = wsm::common::metrics::Registry::instance();

    while (!stopFlag_.load(std::memory_order_acquire)) {
        try {
            runSession_();
        }
        catch (const std::exception& ex) {
            if (!stopFlag_.load(std::memory_order_acquire)) {
                LOG_WARN("LiveSubscriber connection error: " << ex.what());
            }
        }

        source_.close();
        setState_(State::Disconnected);

        if (stopFlag_.load(std::memory_order_acquire)) {
            break;
        }

        reconnects_.fetch_add(1, std::memory_order_relaxed);
        metrics.incrementCounter("reconnect_attempts_total");
        LOG_INFO("LiveSubscriber reconnecting in " << backoff_.count() << " ms (attempt=" << reconnects() << ')');
        waitBackoff_();
    }

    setState_(State::Disconnected);
}

void LiveSubscriber::runSession_() {
    setState_(State::Authorizing);
    source_.open();
    source_.authorize(token_);
    source_.subscribe(symbol_);
    setState_(State::Subscribed);

    auto& metrics = wsm::common::metrics::Registry::instance();
    while (!stopFlag_.load(std::memory_order_acquire)) {
        const auto tick = source_.next_tick();
        if (!tick) {
            continue;
        }

        store_.insertOne(*tick);
        latestPrice_.store(tick->price, std::memory_order_release);
        hasPrice_.store(true, std::memory_order_release);
        ticks_.fetch_add(1, std::memory_order_relaxed);
        metrics.incrementCounter("live_ticks_total");
        LOG_DEBUG("LiveSubscriber tick epoch=" << tick->timestamp << " quote=" << tick->price);
    }
}

void LiveSubscriber::setState_(State state) {
    const auto previous = state_.exchange(state, std::memory_order_acq_rel);
    if (previous != state) {
        LOG_DEBUG("LiveSubscriber state " << stateName(previous) << " -> " << stateName(state));
    }
    wsm::common::metrics::Registry::instance().setGauge("ws_state", state == State::Subscribed ? 1.0 : 0.0);
}

void LiveSubscriber::waitBackoff_() {
    auto waited = std::chrono::milliseconds{0};
    while (waited < backoff_ && !stopFlag_.load(std::memory_order_acquire)) {
        const auto step = std::min(kStopPoll, backoff_ - waited);
        std::this_thread::sleep_for(step);
        waited += step;
    }
}

std::optional<double> LiveSubscriber::latestPrice() const noexcept {
    if (!hasPrice_.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    return latestPrice_.load(std::memory_order_acquire);
}

const char* LiveSubscriber::stateName(State state) noexcept {
    switch (state) {
    case State::Disconnected:
        return "Disconnected";
    case State::Authorizing:
        return "Authorizing";
    case State::Subscribed:
        return "Subscribed";
    }
    return "Unknown";
}

}  // namespace app
