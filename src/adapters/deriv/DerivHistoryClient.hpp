#pragma once

#include <chrono>
#include <string>

#include "adapters/deriv/DerivConnection.hpp"
#include "domain/feed/ITickFeed.hpp"

namespace adapters::deriv {

// Fetches one chunk of tick history per call over its own short-lived connection.
// The timeout bounds the whole chunk, from resolve to the history reply.
class DerivHistoryClient : public domain::IHistoryFetcher {
public:
    DerivHistoryClient(Endpoint endpoint, std::string token, std::chrono::milliseconds timeout);
    ~DerivHistoryClient() override = default;

    domain::FetchResult fetch_ticks(const std::string& symbol, const domain::TimeChunk& chunk) override;

private:
    Endpoint endpoint_;
    std::string token_;
    std::chrono::milliseconds timeout_;
};

}  // namespace adapters::deriv
