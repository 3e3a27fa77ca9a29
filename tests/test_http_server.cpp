#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/HttpServer.hpp"
#include "api/HttpWire.hpp"
#include "api/Router.hpp"
#include "domain/Ports.hpp"

namespace {

using domain::contracts::Candle;

class FixedRepo : public domain::contracts::ICandleReadRepo {
public:
    std::vector<Candle> getCandles(std::size_t limit) const override {
        return std::vector<Candle>(rows_.begin(), rows_.begin() + static_cast<std::ptrdiff_t>(std::min(limit, rows_.size())));
    }
    std::vector<Candle> getSeries(const std::optional<domain::contracts::TimeRange>&) const override { return rows_; }
    std::optional<domain::contracts::PriceRange> getPriceRange(
        const std::optional<domain::contracts::TimeRange>&) const override {
        return domain::contracts::PriceRange{99.0, 104.0};
    }
    std::size_t count() const override { return rows_.size(); }

private:
    std::vector<Candle> rows_{{1706745600000LL, 100, 102, 99, 101, 1000}, {1706832000000LL, 101, 104, 100, 103, 900}};
};

int checkWire() {
    int failures = 0;

    const auto request = ohlcv::api::parseRequestHead("GET /api/fib?start=a&end=b HTTP/1.1\r\nHost: x\r\n\r\n");
    if (!request || request->method != "GET" || request->path != "/api/fib" || request->query != "start=a&end=b" ||
        request->version != "HTTP/1.1") {
        std::cerr << "parseRequestHead split the request line incorrectly\n";
        ++failures;
    }

    for (const char* bad : {"", "GET\r\n", "GET /x\r\n", "GET /x FTP/1.0\r\n", "GET x HTTP/1.1\r\n",
                            "GET /x HTTP/1.1 extra\r\n"}) {
        if (ohlcv::api::parseRequestHead(bad)) {
            std::cerr << "parseRequestHead accepted '" << bad << "'\n";
            ++failures;
        }
    }

    ohlcv::api::Response response{200, "OK", "{}", "application/json", {{"Allow", "GET, HEAD"}}};
    const auto full = ohlcv::api::renderResponse(response, {true, "http://localhost:3000"}, true);
    const std::string expectedHead =
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nAllow: GET, HEAD\r\n"
        "Access-Control-Allow-Origin: http://localhost:3000\r\nVary: Origin\r\n"
        "Access-Control-Allow-Headers: Content-Type\r\nContent-Length: 2\r\nConnection: close\r\n\r\n";
    if (full != expectedHead + "{}") {
        std::cerr << "renderResponse produced:\n" << full << "\n";
        ++failures;
    }

    const auto headOnly = ohlcv::api::renderResponse(response, {}, false);
    if (headOnly.find("Content-Length: 2\r\n") == std::string::npos || headOnly.substr(headOnly.size() - 4) != "\r\n\r\n" ||
        headOnly.find("Access-Control") != std::string::npos) {
        std::cerr << "HEAD rendering must keep Content-Length and drop the body\n";
        ++failures;
    }
    return failures;
}

std::string roundTrip(std::uint16_t port, const std::string& raw) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return {};
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    std::string reply;
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::send(fd, raw.data(), raw.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(raw.size())) {
        char chunk[2048];
        ssize_t received = 0;
        while ((received = ::recv(fd, chunk, sizeof(chunk), 0)) > 0) {
            reply.append(chunk, static_cast<std::size_t>(received));
        }
    }
    ::close(fd);
    return reply;
}

int checkServer() {
    int failures = 0;

    ohlcv::api::HttpServer server({"127.0.0.1", 0}, 2,
                                  ohlcv::api::Router(std::make_shared<FixedRepo>(), "does-not-exist", 2));
    server.setCorsPolicy({true, "http://example.test"});
    server.start();
    const auto port = server.boundPort();
    if (port == 0) {
        std::cerr << "server did not report its bound port\n";
        return 1;
    }

    const auto candles = roundTrip(port, "GET /api/candles?limit=1 HTTP/1.1\r\nHost: test\r\n\r\n");
    if (candles.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 || candles.find("\"2024-02-01 00:00:00\"") == std::string::npos ||
        candles.find("\"2024-02-02 00:00:00\"") != std::string::npos ||
        candles.find("Access-Control-Allow-Origin: http://example.test\r\n") == std::string::npos) {
        std::cerr << "GET /api/candles over the socket:\n" << candles << "\n";
        ++failures;
    }

    const auto head = roundTrip(port, "HEAD /healthz HTTP/1.1\r\n\r\n");
    if (head.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 || head.substr(head.size() - 4) != "\r\n\r\n") {
        std::cerr << "HEAD /healthz must answer headers only:\n" << head << "\n";
        ++failures;
    }

    const auto garbage = roundTrip(port, "NONSENSE\r\n\r\n");
    if (garbage.rfind("HTTP/1.1 400 ", 0) != 0 || garbage.find("bad_request") == std::string::npos) {
        std::cerr << "malformed request line:\n" << garbage << "\n";
        ++failures;
    }

    server.stop();
    return failures;
}

}  // namespace

int main() {
    const int failures = checkWire() + checkServer();
    if (failures != 0) {
        std::cerr << failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
