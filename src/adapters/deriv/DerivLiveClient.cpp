#include "adapters/deriv/DerivLiveClient.hpp"

#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "adapters/deriv/DerivProtocol.hpp"
#include "common/Log.hpp"

namespace adapters::deriv {
namespace {

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("DerivLiveClient: " + message);
}

}  // namespace

DerivLiveClient::DerivLiveClient(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

DerivLiveClient::~DerivLiveClient() {
    close();
}

void DerivLiveClient::open() {
    close();

    auto connection = std::make_shared<DerivConnection>(endpoint_, std::nullopt);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelRequested_) {
            throw make_error("cancelled before open");
        }
        active_ = connection;
    }
    connection->connect();
    LOG_INFO("DerivLiveClient connected to " << endpoint_.host << endpoint_.target());
}

void DerivLiveClient::authorize(const std::string& token) {
    if (token.empty()) {
        LOG_DEBUG("DerivLiveClient no token configured, skipping authorize");
        return;
    }
    auto connection = connection_();
    connection->send(make_authorize_request(token));
    ensure_authorized(connection->receive());
}

void DerivLiveClient::subscribe(const std::string& symbol) {
    auto connection = connection_();
    connection->send(make_subscribe_request(symbol));
    LOG_INFO("DerivLiveClient subscribe requested symbol=" << symbol);
}

std::optional<domain::Tick> DerivLiveClient::next_tick() {
    auto connection = connection_();
    const auto payload = connection->receive();

    if (auto tick = parse_tick_message(payload)) {
        return tick;
    }

    boost::json::error_code ec;
    const auto message = boost::json::parse(payload, ec);
    if (!ec) {
        if (auto error = upstream_error(message)) {
            LOG_WARN("DerivLiveClient upstream error ignored: " << *error);
        }
    }
    return std::nullopt;
}

void DerivLiveClient::close() noexcept {
    std::shared_ptr<DerivConnection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection = std::move(active_);
    }
    if (connection) {
        connection->close();
    }
}

void DerivLiveClient::cancel() noexcept {
    std::shared_ptr<DerivConnection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelRequested_ = true;
        connection = active_;
    }
    if (connection) {
        connection->cancel();
    }
}

std::shared_ptr<DerivConnection> DerivLiveClient::connection_() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        throw make_error("not connected");
    }
    return active_;
}

}  // namespace adapters::deriv
