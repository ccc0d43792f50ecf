#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "adapters/deriv/DerivConnection.hpp"
#include "domain/feed/ITickFeed.hpp"

namespace adapters::deriv {

class DerivLiveClient : public domain::ILiveTickSource {
public:
    explicit DerivLiveClient(Endpoint endpoint);
    ~DerivLiveClient() override;

    void open() override;
    void authorize(const std::string& token) override;
    void subscribe(const std::string& symbol) override;
    std::optional<domain::Tick> next_tick() override;
    void close() noexcept override;
    void cancel() noexcept override;

private:
    std::shared_ptr<DerivConnection> connection_() const;

    Endpoint endpoint_;
    mutable std::mutex mutex_;
    std::shared_ptr<DerivConnection> active_;
    bool cancelRequested_{false};
};

}  // namespace adapters::deriv
