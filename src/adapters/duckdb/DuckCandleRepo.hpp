#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Candle reads over one DuckDB connection. The connection is not safe for
// concurrent use, so every query holds mutex_ from prepare to last fetch.
class DuckCandleRepo : public domain::contracts::ICandleReadRepo {
public:
    explicit DuckCandleRepo(std::string dbPath = "data/data.duckdb");
    ~DuckCandleRepo() override;

    DuckCandleRepo(const DuckCandleRepo&) = delete;
    DuckCandleRepo& operator=(const DuckCandleRepo&) = delete;

    std::vector<domain::contracts::Candle> getCandles(std::size_t limit) const override;

    std::vector<domain::contracts::Candle>
    getSeries(const std::optional<domain::contracts::TimeRange>& range) const override;

    std::optional<domain::contracts::PriceRange>
    getPriceRange(const std::optional<domain::contracts::TimeRange>& range) const override;

    std::size_t count() const override;

    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> database_;
    std::unique_ptr<::duckdb::Connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace adapters::duckdb
