#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "api/HttpWire.hpp"
#include "api/Router.hpp"

namespace ohlcv::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Blocking HTTP/1.1 server: a fixed pool of workers, each accepting and
// answering one connection at a time. Every response closes its connection.
class HttpServer {
public:
    HttpServer(Endpoint endpoint, std::size_t threadCount, Router router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds, listens and launches the workers. Throws std::runtime_error when
    // the listener cannot be opened.
    void start();
    void stop();
    void wait();

    void setCorsPolicy(CorsPolicy policy);

    // Port actually bound; differs from the endpoint when it asked for 0.
    std::uint16_t boundPort() const noexcept { return boundPort_; }

private:
    void workerLoop(std::size_t workerId);
    void serveConnection(int clientFd);
    Response dispatch(const std::string& head, std::string& method);

    Endpoint endpoint_;
    std::size_t threadCount_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    int listenFd_ = -1;
    std::uint16_t boundPort_ = 0;
    Router router_;
    CorsPolicy cors_{};
};

}  // namespace ohlcv::api
