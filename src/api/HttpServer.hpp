#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace wsm::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Blocking accept loop shared by a fixed set of worker threads; one request per connection.
class HttpServer {
public:
    HttpServer(Endpoint endpoint, std::size_t threadCount);
    ~HttpServer();

    void start();
    void stop();
    void wait();

private:
    void workerLoop(std::size_t workerId);
    void handleClient(int clientFd);

    Endpoint endpoint_;
    std::size_t threadCount_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    Router router_{};
};

// Parses the request line, headers and Content-Length body of a raw HTTP/1.1 request.
Request parseRequest(const std::string& raw);

}  // namespace wsm::api
