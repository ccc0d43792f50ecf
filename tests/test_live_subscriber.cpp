#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "app/LiveSubscriber.hpp"
#include "core/TickStore.hpp"
#include "domain/feed/ITickFeed.hpp"

namespace {
using namespace std::chrono_literals;

// Fails the first open, then replays queued messages and blocks until cancelled.
class FakeLiveSource : public domain::ILiveTickSource {
public:
    void open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++opens_;
        if (opens_ == 1) {
            throw std::runtime_error("connection refused");
        }
    }

    void authorize(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        token_ = token;
    }

    void subscribe(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        symbol_ = symbol;
    }

    std::optional<domain::Tick> next_tick() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return cancelled_ || !queue_.empty(); });
        if (queue_.empty()) {
            throw std::runtime_error("read cancelled");
        }
        auto message = queue_.front();
        queue_.pop_front();
        return message;
    }

    void close() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closes_;
    }

    void cancel() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void push(std::optional<domain::Tick> message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(message);
        }
        cv_.notify_all();
    }

    int opens() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opens_;
    }

    std::string token() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return token_;
    }

    std::string symbol() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return symbol_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::optional<domain::Tick>> queue_;
    bool cancelled_{false};
    int opens_{0};
    int closes_{0};
    std::string token_;
    std::string symbol_;
};

bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

}  // namespace

int main() {
    FakeLiveSource source;
    core::TickStore store;
    std::atomic<bool> stop{false};
    app::LiveSubscriber live(source, store, stop, "R_100", "secret", 20ms);

    source.push(domain::make_live_tick(1000, 10.0));
    source.push(std::nullopt);
    source.push(domain::make_live_tick(1001, 11.0));
    source.push(domain::make_live_tick(1001, 11.5));
    source.push(domain::make_live_tick(1002, 12.0));

    if (live.latestPrice().has_value()) {
        std::cerr << "Expected no price before any tick\n";
        return 1;
    }

    live.start();

    if (!waitForCondition([&]() { return store.count() == 3U && live.ticksReceived() == 4U; }, 2000ms)) {
        std::cerr << "Expected three distinct ticks (store=" << store.count() << ", received="
                  << live.ticksReceived() << ")\n";
        return 1;
    }
    if (live.state() != app::LiveSubscriber::State::Subscribed) {
        std::cerr << "Expected Subscribed state, got " << app::LiveSubscriber::stateName(live.state()) << "\n";
        return 1;
    }
    if (live.reconnects() != 1U || source.opens() != 2) {
        std::cerr << "Expected one reconnect after the failed open (reconnects=" << live.reconnects() << ")\n";
        return 1;
    }
    if (live.latestPrice().value_or(0.0) != 12.0) {
        std::cerr << "Expected latest price 12.0\n";
        return 1;
    }
    if (source.token() != "secret" || source.symbol() != "R_100") {
        std::cerr << "Expected authorize and subscribe with the configured token and symbol\n";
        return 1;
    }

    stop.store(true);
    const auto stopStarted = std::chrono::steady_clock::now();
    live.stop();
    if (std::chrono::steady_clock::now() - stopStarted > 1s) {
        std::cerr << "Stopping took too long\n";
        return 1;
    }
    if (live.state() != app::LiveSubscriber::State::Disconnected) {
        std::cerr << "Expected Disconnected after stop\n";
        return 1;
    }

    return 0;
}
