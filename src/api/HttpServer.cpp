#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "common/Log.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace ohlcv::api {

namespace {

constexpr std::size_t kMaxRequestHeadBytes = 8192;
constexpr int kReceiveTimeoutSeconds = 10;

// Owns a socket descriptor; closes it unless released.
class SocketGuard {
public:
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
            ::close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }

private:
    int fd_;
};

std::runtime_error socketError(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

// Returns a listening IPv4 socket for `endpoint` and stores the bound port.
int openListener(const Endpoint& endpoint, std::uint16_t& boundPort) {
    SocketGuard listener(::socket(AF_INET, SOCK_STREAM, 0));
    if (listener.get() < 0) {
        throw socketError("No se pudo crear el socket del servidor");
    }

    const int reuse = 1;
    if (::setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_WARN("No se pudo activar SO_REUSEADDR: " << std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (!endpoint.address.empty() && ::inet_pton(AF_INET, endpoint.address.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Dirección inválida: " + endpoint.address);
    }

    if (::bind(listener.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw socketError("No se pudo enlazar el socket");
    }
    if (::listen(listener.get(), SOMAXCONN) < 0) {
        throw socketError("No se pudo iniciar la escucha");
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    boundPort = ::getsockname(listener.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0
                    ? ntohs(bound.sin_port)
                    : endpoint.port;
    return listener.release();
}

enum class HeadStatus { Complete, Closed, TooLarge };

// Reads until the blank line ending the request head. A peer that stops
// sending early (or times out) yields whatever arrived.
HeadStatus readHead(int fd, std::string& head) {
    char chunk[1024];
    while (head.find("\r\n\r\n") == std::string::npos) {
        const auto received = ::recv(fd, chunk, sizeof(chunk), 0);
        if (received <= 0) {
            return head.empty() ? HeadStatus::Closed : HeadStatus::Complete;
        }
        head.append(chunk, static_cast<std::size_t>(received));
        if (head.size() > kMaxRequestHeadBytes) {
            return HeadStatus::TooLarge;
        }
    }
    return HeadStatus::Complete;
}

void sendAll(int fd, std::string_view data) {
    while (!data.empty()) {
        const auto written = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (written <= 0) {
            LOG_DEBUG("Cliente cerró la conexión antes de completar la respuesta");
            return;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
}

}  // namespace

HttpServer::HttpServer(Endpoint endpoint, std::size_t threadCount, Router router)
    : endpoint_(std::move(endpoint)), threadCount_(threadCount ? threadCount : 1), router_(std::move(router)) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsPolicy(CorsPolicy policy) { cors_ = std::move(policy); }

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    try {
        listenFd_ = openListener(endpoint_, boundPort_);
    }
    catch (const std::exception&) {
        running_.store(false);
        throw;
    }

    LOG_INFO("HTTP server escuchando en " << (endpoint_.address.empty() ? "0.0.0.0" : endpoint_.address) << ':'
                                          << boundPort_ << " con " << threadCount_ << " workers");

    workers_.reserve(threadCount_);
    for (std::size_t id = 0; id < threadCount_; ++id) {
        workers_.emplace_back([this, id] { workerLoop(id); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Shutting the listener down wakes every worker blocked in accept().
    ::shutdown(listenFd_, SHUT_RDWR);
    ::close(listenFd_);
    listenFd_ = -1;
    wait();
}

void HttpServer::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void HttpServer::workerLoop(std::size_t workerId) {
    LOG_DEBUG("Worker " << workerId << " iniciado");

    while (running_.load()) {
        const int clientFd = ::accept(listenFd_, nullptr, nullptr);
        if (clientFd >= 0) {
            serveConnection(clientFd);
            continue;
        }
        if (!running_.load() || errno == EBADF || errno == EINVAL) {
            break;
        }
        if (errno != EINTR) {
            LOG_WARN("Error aceptando conexión: " << std::strerror(errno));
        }
    }

    LOG_DEBUG("Worker " << workerId << " finalizado");
}

void HttpServer::serveConnection(int clientFd) {
    SocketGuard client(clientFd);

    timeval timeout{};
    timeout.tv_sec = kReceiveTimeoutSeconds;
    if (::setsockopt(client.get(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        LOG_DEBUG("No se pudo fijar SO_RCVTIMEO: " << std::strerror(errno));
    }

    std::string head;
    const auto status = readHead(client.get(), head);
    if (status == HeadStatus::Closed) {
        return;
    }

    std::string method;
    Response response{};
    if (status == HeadStatus::TooLarge) {
        LOG_WARN("Cabecera HTTP demasiado grande (" << head.size() << " bytes)");
        ohlcv::http::json_error(response, 400, ohlcv::http::errors::bad_request);
    }
    else {
        response = dispatch(head, method);
    }

    sendAll(client.get(), renderResponse(response, cors_, method != "HEAD"));
}

Response HttpServer::dispatch(const std::string& head, std::string& method) {
    Response response{};
    const auto request = parseRequestHead(head);
    if (!request) {
        LOG_WARN("Solicitud HTTP inválida (" << head.size() << " bytes)");
        ohlcv::http::json_error(response, 400, ohlcv::http::errors::bad_request);
        return response;
    }

    method = request->method;
    try {
        response = router_.handle(*request);
    }
    catch (const std::exception& ex) {
        LOG_ERR("Error atendiendo " << request->method << ' ' << request->path << ": " << ex.what());
        ohlcv::http::json_error(response, 500, ohlcv::http::errors::internal_error, ex.what());
    }

    LOG_DEBUG(request->method << ' ' << request->target << " -> " << response.statusCode);
    return response;
}

}  // namespace ohlcv::api
