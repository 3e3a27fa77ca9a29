#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace ohlcv::common {

struct Config {
    std::uint16_t port = 8000;
    std::string bindAddress = "0.0.0.0";
    ohlcv::log::Level logLevel = ohlcv::log::Level::Info;
    std::size_t threads = 4;

    std::string duckdbPath = "data/data.duckdb";
    std::string csvPath = "data/stocks.csv";
    std::string staticDir = "static";

    std::int32_t httpDefaultLimit = 500;
    std::int32_t httpMaxLimit = 5000;
    bool httpCorsEnable = false;
    std::string httpCorsOrigin;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace ohlcv::common
