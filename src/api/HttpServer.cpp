#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"

namespace wsm::api {

namespace {

constexpr std::size_t kMaxHeaderBytes = 8192;
constexpr std::size_t kMaxBodyBytes = 65536;

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(endpoint.port);
    }
    return endpoint.address + ':' + std::to_string(endpoint.port);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trimCopy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

std::size_t contentLengthOf(const std::string& headers) {
    std::istringstream stream(headers);
    std::string line;
    while (std::getline(stream, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (toLowerCopy(trimCopy(line.substr(0, colon))) == "content-length") {
            try {
                return std::min<std::size_t>(std::stoul(trimCopy(line.substr(colon + 1))), kMaxBodyBytes);
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

}  // namespace

Request parseRequest(const std::string& raw) {
    const auto headerEnd = raw.find("\r\n\r\n");
    const std::string head = raw.substr(0, headerEnd);

    std::istringstream requestStream(head);
    std::string requestLine;
    std::getline(requestStream, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    std::istringstream lineStream(requestLine);
    Request request{};
    lineStream >> request.method >> request.target >> request.version;

    const auto queryPos = request.target.find('?');
    if (queryPos != std::string::npos) {
        request.path = request.target.substr(0, queryPos);
        request.query = request.target.substr(queryPos + 1);
    } else {
        request.path = request.target;
    }

    std::string line;
    while (std::getline(requestStream, line)) {
        const auto colon = line.find(':');
        if (colon != std::string::npos && toLowerCopy(trimCopy(line.substr(0, colon))) == "content-type") {
            request.contentType = toLowerCopy(trimCopy(line.substr(colon + 1)));
        }
    }

    if (headerEnd != std::string::npos) {
        const auto length = contentLengthOf(head);
        request.body = raw.substr(headerEnd + 4, length);
    }
    return request;
}

HttpServer::HttpServer(Endpoint endpoint, std::size_t threadCount)
    : endpoint_(std::move(endpoint)), threadCount_(threadCount ? threadCount : 1) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    serverFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        running_.store(false);
        throw std::runtime_error("Could not create server socket: " + describeErrno(errno));
    }

    int opt = 1;
    ::setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    if (endpoint_.address.empty() || endpoint_.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (::inet_pton(AF_INET, endpoint_.address.c_str(), &addr.sin_addr) != 1) {
            ::close(serverFd_);
            serverFd_ = -1;
            running_.store(false);
            throw std::runtime_error("Invalid address: " + endpoint_.address);
        }
    }

    if (::bind(serverFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Could not bind socket: " + message);
    }

    if (::listen(serverFd_, SOMAXCONN) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Could not listen: " + message);
    }

    LOG_INFO("HTTP server listening on " << formatAddress(endpoint_));

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
        ::close(serverFd_);
        serverFd_ = -1;
    }

    wait();
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId) {
    wsm::log::setThreadName("http-" + std::to_string(workerId));
    LOG_DEBUG("HTTP worker " << workerId << " started");

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;
            }
            LOG_WARN("HTTP accept failed: " << describeErrno(errno));
            continue;
        }

        handleClient(clientFd);
    }

    LOG_DEBUG("HTTP worker " << workerId << " finished");
}

void HttpServer::handleClient(int clientFd) {
    std::string raw;
    raw.reserve(1024);
    char buffer[1024];

    while (raw.find("\r\n\r\n") == std::string::npos) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes));
        if (raw.size() > kMaxHeaderBytes) {
            break;
        }
    }

    const auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd != std::string::npos) {
        const auto wanted = headerEnd + 4 + contentLengthOf(raw.substr(0, headerEnd));
        while (raw.size() < wanted) {
            const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
            if (bytes <= 0) {
                break;
            }
            raw.append(buffer, static_cast<std::size_t>(bytes));
        }
    }

    const auto apiRequest = parseRequest(raw);
    const auto responseData = router_.handle(apiRequest);
    const auto& body = responseData.body;

    std::ostringstream response;
    response << "HTTP/1.1 " << responseData.statusCode << ' ' << responseData.statusText << "\r\n";
    const std::string contentType = responseData.contentType.empty() ? "application/json" : responseData.contentType;
    response << "Content-Type: " << contentType << "\r\n";
    for (const auto& header : responseData.headers) {
        if (!header.first.empty()) {
            response << header.first << ": " << header.second << "\r\n";
        }
    }
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << body;

    const auto responseStr = response.str();
    const char* data = responseStr.data();
    std::size_t remaining = responseStr.size();

    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            break;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

}  // namespace wsm::api
