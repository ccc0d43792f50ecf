#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Result.hpp"
#include "domain/Models.hpp"

namespace domain {

// Half-open time range [start, end) in epoch seconds.
struct TimeChunk {
    TimestampSec start{0};
    TimestampSec end{0};

    bool empty() const noexcept { return end <= start; }
    bool operator==(const TimeChunk& other) const noexcept {
        return start == other.start && end == other.end;
    }
};

struct FetchError {
    enum class Kind {
        Transport,
        Timeout,
        Protocol,
        Upstream,
    };

    Kind kind{Kind::Transport};
    std::string message;
};

const char* to_string(FetchError::Kind kind) noexcept;

using TickBatch = std::vector<Tick>;
using FetchResult = wsm::common::Result<TickBatch, FetchError>;

class IHistoryFetcher {
public:
    virtual ~IHistoryFetcher() = default;

    // Must be callable from several threads at once.
    virtual FetchResult fetch_ticks(const std::string& symbol, const TimeChunk& chunk) = 0;
};

class ILiveTickSource {
public:
    virtual ~ILiveTickSource() = default;

    virtual void open() = 0;
    virtual void authorize(const std::string& token) = 0;
    virtual void subscribe(const std::string& symbol) = 0;

    // Blocks for the next message. Returns nullopt for messages that are not ticks.
    // Throws on transport failure.
    virtual std::optional<Tick> next_tick() = 0;

    virtual void close() noexcept = 0;

    // Thread-safe; unblocks a pending next_tick() so the caller can re-check its stop flag.
    virtual void cancel() noexcept = 0;
};

}  // namespace domain
