#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace adapters::deriv {

struct Endpoint {
    std::string host{"ws.derivws.com"};
    std::string port{"443"};
    std::string appId{"1089"};

    std::string target() const { return "/websockets/v3?app_id=" + appId; }
};

class ConnectionError : public std::runtime_error {
public:
    ConnectionError(const std::string& message, bool timedOut)
        : std::runtime_error(message), timedOut_(timedOut) {}

    bool timedOut() const noexcept { return timedOut_; }

private:
    bool timedOut_;
};

// Blocking TLS websocket to the Deriv API. Every step runs as an async operation on a
// private io_context so it can be bounded by a deadline or cancelled from another thread.
class DerivConnection {
public:
    // A missing step timeout means operations wait until data or error.
    DerivConnection(Endpoint endpoint, std::optional<std::chrono::milliseconds> stepTimeout);
    ~DerivConnection();

    DerivConnection(const DerivConnection&) = delete;
    DerivConnection& operator=(const DerivConnection&) = delete;

    // Caps every later step, whatever its own timeout. Steps started after the
    // deadline fail as timed out.
    void setDeadline(std::chrono::steady_clock::time_point deadline);

    void connect();
    void send(const std::string& text);
    std::string receive();
    void close() noexcept;

    // Thread-safe. Aborts the pending operation; later operations fail immediately.
    void cancel() noexcept;

private:
    using WsStream = boost::beast::websocket::stream<
        boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    template <typename Initiate>
    void await_(const std::string& step,
                std::optional<std::chrono::milliseconds> timeout,
                Initiate&& initiate);
    void abort_io_() noexcept;

    Endpoint endpoint_;
    std::optional<std::chrono::milliseconds> stepTimeout_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslCtx_;
    boost::asio::ip::tcp::resolver resolver_;
    std::unique_ptr<WsStream> ws_;
    boost::beast::flat_buffer buffer_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace adapters::deriv
