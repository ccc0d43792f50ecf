#include "adapters/deriv/DerivConnection.hpp"

#include <sstream>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "common/Log.hpp"

namespace adapters::deriv {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr std::chrono::milliseconds kCloseTimeout{2000};
constexpr const char* kUserAgent = "WallSpectrum-DerivClient";

}  // namespace

DerivConnection::DerivConnection(Endpoint endpoint, std::optional<std::chrono::milliseconds> stepTimeout)
    : endpoint_(std::move(endpoint)),
      stepTimeout_(stepTimeout),
      sslCtx_(ssl::context::tls_client),
      resolver_(ioc_) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

DerivConnection::~DerivConnection() {
    close();
}

void DerivConnection::setDeadline(std::chrono::steady_clock::time_point deadline) {
    deadline_ = deadline;
}

template <typename Initiate>
void DerivConnection::await_(const std::string& step,
                             std::optional<std::chrono::milliseconds> timeout,
                             Initiate&& initiate) {
    if (cancelled_.load(std::memory_order_acquire)) {
        throw ConnectionError(step + " cancelled", false);
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = std::chrono::steady_clock::now() + *timeout;
    }
    if (deadline_ && (!deadline || *deadline_ < *deadline)) {
        deadline = deadline_;
    }
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
        throw ConnectionError(step + " timed out", true);
    }

    beast::error_code result;
    bool done = false;
    initiate([&result, &done](beast::error_code ec, auto&&...) {
        result = ec;
        done = true;
    });

    ioc_.restart();
    bool timedOut = false;
    if (deadline) {
        while (!done) {
            if (std::chrono::steady_clock::now() >= *deadline) {
                timedOut = true;
                abort_io_();
                break;
            }
            ioc_.run_one_until(*deadline);
        }
    }
    // Without a deadline this blocks until completion; after an abort it drains the
    // cancelled operation.
    while (!done && ioc_.run_one() > 0) {
    }

    if (timedOut) {
        throw ConnectionError(step + " timed out", true);
    }
    if (!done) {
        throw ConnectionError(step + " interrupted", false);
    }
    if (result) {
        throw ConnectionError(step + " failed: " + result.message(), result == beast::error::timeout);
    }
}

void DerivConnection::connect() {
    ws_ = std::make_unique<WsStream>(ioc_, sslCtx_);
    buffer_.clear();

    auto& tls = ws_->next_layer();
    tls.set_verify_callback(ssl::host_name_verification(endpoint_.host));
    if (!::SSL_set_tlsext_host_name(tls.native_handle(), endpoint_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI host name to '" << endpoint_.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw ConnectionError(oss.str(), false);
    }

    net::ip::tcp::resolver::results_type endpoints;
    await_("DNS resolve", stepTimeout_, [this, &endpoints](auto handler) {
        resolver_.async_resolve(endpoint_.host,
                                endpoint_.port,
                                [&endpoints, handler](const beast::error_code& ec,
                                                      net::ip::tcp::resolver::results_type results) mutable {
                                    endpoints = std::move(results);
                                    handler(ec);
                                });
    });

    await_("connect", stepTimeout_, [this, &endpoints](auto handler) {
        beast::get_lowest_layer(*ws_).async_connect(endpoints, std::move(handler));
    });

    await_("TLS handshake", stepTimeout_, [this](auto handler) {
        ws_->next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
    });

    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, kUserAgent);
    }));

    const auto target = endpoint_.target();
    await_("WebSocket handshake", stepTimeout_, [this, &target](auto handler) {
        ws_->async_handshake(endpoint_.host, target, std::move(handler));
    });
    ws_->text(true);

    LOG_DEBUG("DerivConnection connected to " << endpoint_.host << target);
}

void DerivConnection::send(const std::string& text) {
    if (!ws_) {
        throw ConnectionError("send on a closed connection", false);
    }
    await_("write", stepTimeout_, [this, &text](auto handler) {
        ws_->async_write(net::buffer(text), std::move(handler));
    });
}

std::string DerivConnection::receive() {
    if (!ws_) {
        throw ConnectionError("receive on a closed connection", false);
    }
    buffer_.clear();
    await_("read", stepTimeout_, [this](auto handler) {
        ws_->async_read(buffer_, std::move(handler));
    });
    return beast::buffers_to_string(buffer_.cdata());
}

void DerivConnection::close() noexcept {
    if (!ws_) {
        return;
    }

    if (ws_->is_open() && !cancelled_.load(std::memory_order_acquire)) {
        try {
            await_("close", kCloseTimeout, [this](auto handler) {
                ws_->async_close(websocket::close_code::normal, std::move(handler));
            });
        }
        catch (const std::exception& ex) {
            LOG_DEBUG("DerivConnection close: " << ex.what());
        }
    }

    abort_io_();
    ioc_.restart();
    ioc_.poll();
    ws_.reset();
}

void DerivConnection::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
    try {
        net::post(ioc_, [this]() { abort_io_(); });
    }
    catch (const std::exception& ex) {
        LOG_WARN("DerivConnection cancel could not be scheduled: " << ex.what());
    }
}

void DerivConnection::abort_io_() noexcept {
    resolver_.cancel();
    if (!ws_) {
        return;
    }
    beast::error_code ec;
    auto& socket = beast::get_lowest_layer(*ws_).socket();
    if (socket.is_open()) {
        socket.shutdown(net::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

}  // namespace adapters::deriv
