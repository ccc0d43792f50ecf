#include "adapters/deriv/DerivHistoryClient.hpp"

#include <exception>
#include <utility>

#include "adapters/deriv/DerivProtocol.hpp"
#include "common/Log.hpp"

namespace adapters::deriv {

DerivHistoryClient::DerivHistoryClient(Endpoint endpoint, std::string token, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), token_(std::move(token)), timeout_(timeout) {}

domain::FetchResult DerivHistoryClient::fetch_ticks(const std::string& symbol, const domain::TimeChunk& chunk) {
    if (chunk.empty()) {
        return domain::FetchResult::success({});
    }

    try {
        DerivConnection connection(endpoint_, timeout_);
        connection.setDeadline(std::chrono::steady_clock::now() + timeout_);
        connection.connect();

        if (!token_.empty()) {
            connection.send(make_authorize_request(token_));
            ensure_authorized(connection.receive());
        }

        connection.send(make_history_request(symbol, chunk));
        const auto reply = connection.receive();
        connection.close();

        auto result = parse_history_response(reply, chunk);
        if (result.ok()) {
            LOG_DEBUG("DerivHistoryClient chunk [" << chunk.start << ',' << chunk.end << ") ticks="
                                                   << result.value().size());
        }
        return result;
    }
    catch (const ConnectionError& ex) {
        const auto kind = ex.timedOut() ? domain::FetchError::Kind::Timeout : domain::FetchError::Kind::Transport;
        return domain::FetchResult::failure(domain::FetchError{kind, ex.what()});
    }
    catch (const std::exception& ex) {
        return domain::FetchResult::failure(domain::FetchError{domain::FetchError::Kind::Upstream, ex.what()});
    }
}

}  // namespace adapters::deriv
