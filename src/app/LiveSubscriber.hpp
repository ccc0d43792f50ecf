#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

#include "domain/feed/ITickFeed.hpp"

namespace core {
class TickStore;
}

namespace app {

class LiveSubscriber {
public:
    enum class State {
        Disconnected,
        Authorizing,
        Subscribed,
    };

    static constexpr std::chrono::milliseconds kDefaultBackoff{5000};

    LiveSubscriber(domain::ILiveTickSource& source,
                   core::TickStore& store,
                   const std::atomic<bool>& stopFlag,
                   std::string symbol,
                   std::string token,
                   std::chrono::milliseconds backoff = kDefaultBackoff);
    ~LiveSubscriber();

    LiveSubscriber(const LiveSubscriber&) = delete;
    LiveSubscriber& operator=(const LiveSubscriber&) = delete;

    void start();

    // Interrupts the pending read and joins the worker. The caller raises the stop flag first.
    void stop();

    // Runs the subscription loop on the calling thread until the stop flag is raised.
    void run();

    [[nodiscard]] State state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] std::optional<double> latestPrice() const noexcept;
    [[nodiscard]] std::uint64_t reconnects() const noexcept { return reconnects_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t ticksReceived() const noexcept { return ticks_.load(std::memory_order_relaxed); }

    static const char* stateName(State state) noexcept;

private:
    void runSession_();
    void setState_(State state);
    void waitBackoff_();

    domain::ILiveTickSource& source_;
    core::TickStore& store_;
    const std::atomic<bool>& stopFlag_;
    std::string symbol_;
    std::string token_;
    std::chrono::milliseconds backoff_;

    std::atomic<State> state_{State::Disconnected};
    std::atomic<double> latestPrice_{0.0};
    std::atomic<bool> hasPrice_{false};
    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<std::uint64_t> ticks_{0};
    std::thread worker_;
};

}  // namespace app
