#include "adapters/duckdb/DuckCandleRepo.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace adapters::duckdb {
namespace {

constexpr auto kSelectColumns =
    "SELECT epoch_ms(timestamp) AS ts, open, high, low, close, volume FROM candles WHERE timestamp IS NOT NULL";
constexpr auto kRangePredicate = " AND epoch_ms(timestamp) BETWEEN ? AND ?";

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

std::size_t reserveForLimit(std::size_t limit) {
    if (limit == 0) {
        return 256;
    }
    return std::min<std::size_t>(limit, 4096);
}

double doubleOrNaN(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return value.GetValue<double>();
}

std::int64_t countOrZero(const ::duckdb::Value& value) {
    return value.IsNull() ? 0 : value.GetValue<std::int64_t>();
}

void appendRange(std::string& query,
                 DuckdbValueVector& parameters,
                 const std::optional<domain::contracts::TimeRange>& range) {
    if (!range) {
        return;
    }
    query += kRangePredicate;
    parameters.emplace_back(::duckdb::Value::BIGINT(range->fromMs));
    parameters.emplace_back(::duckdb::Value::BIGINT(range->toMs));
}

std::unique_ptr<::duckdb::QueryResult> execute(::duckdb::Connection& connection,
                                               const std::string& query,
                                               DuckdbValueVector& parameters) {
    auto statement = connection.Prepare(query);
    if (!statement || statement->HasError()) {
        const std::string errorMessage =
            statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw std::runtime_error("DuckCandleRepo prepare failed: " + errorMessage);
    }

    auto result = statement->Execute(parameters);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
        throw std::runtime_error("DuckCandleRepo query failed: " + errorMessage);
    }
    return result;
}

std::vector<domain::contracts::Candle> fetchCandles(::duckdb::QueryResult& result, std::size_t limit) {
    std::vector<domain::contracts::Candle> candles;
    candles.reserve(reserveForLimit(limit));

    while (auto chunk = result.Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::contracts::Candle candle{};
            candle.ts = chunk->GetValue(0, row).GetValue<std::int64_t>();
            candle.o = doubleOrNaN(chunk->GetValue(1, row));
            candle.h = doubleOrNaN(chunk->GetValue(2, row));
            candle.l = doubleOrNaN(chunk->GetValue(3, row));
            candle.c = doubleOrNaN(chunk->GetValue(4, row));
            candle.v = doubleOrNaN(chunk->GetValue(5, row));
            candles.push_back(candle);
        }
    }
    return candles;
}

}  // namespace

DuckCandleRepo::DuckCandleRepo(std::string dbPath) : dbPath_(std::move(dbPath)) {
    database_ = std::make_unique<::duckdb::DuckDB>(dbPath_);
    connection_ = std::make_unique<::duckdb::Connection>(*database_);
    LOG_DEBUG("DuckCandleRepo opened " << dbPath_);
}

DuckCandleRepo::~DuckCandleRepo() = default;

std::vector<domain::contracts::Candle> DuckCandleRepo::getCandles(std::size_t limit) const {
    std::string query = kSelectColumns;
    query += " ORDER BY timestamp ASC LIMIT ?";

    DuckdbValueVector parameters;
    const auto limitValue = static_cast<std::int64_t>(
        std::min<std::size_t>(limit, static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max())));
    parameters.emplace_back(::duckdb::Value::BIGINT(limitValue));

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = execute(*connection_, query, parameters);
    return fetchCandles(*result, limit);
}

std::vector<domain::contracts::Candle>
DuckCandleRepo::getSeries(const std::optional<domain::contracts::TimeRange>& range) const {
    std::string query = kSelectColumns;
    DuckdbValueVector parameters;
    appendRange(query, parameters, range);
    query += " ORDER BY timestamp ASC";

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = execute(*connection_, query, parameters);
    return fetchCandles(*result, 0);
}

std::optional<domain::contracts::PriceRange>
DuckCandleRepo::getPriceRange(const std::optional<domain::contracts::TimeRange>& range) const {
    // min/max skip NULLs and DuckDB orders NaN above every number, so the
    // aggregate alone can look finite over bad rows. The extra columns count
    // NULL and non-finite bounds in the selection.
    std::string query =
        "SELECT min(low), max(high), count(*), count(low), count(high), "
        "coalesce(bool_or(NOT isfinite(low) OR NOT isfinite(high)), false) "
        "FROM candles WHERE timestamp IS NOT NULL";
    DuckdbValueVector parameters;
    appendRange(query, parameters, range);

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = execute(*connection_, query, parameters);

    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0) {
        return std::nullopt;
    }

    const auto rows = countOrZero(chunk->GetValue(2, 0));
    if (rows == 0) {
        return std::nullopt;
    }

    const bool nullBound = countOrZero(chunk->GetValue(3, 0)) != rows || countOrZero(chunk->GetValue(4, 0)) != rows;
    const auto nonFinite = chunk->GetValue(5, 0);
    if (nullBound || (!nonFinite.IsNull() && nonFinite.GetValue<bool>())) {
        LOG_WARN("DuckCandleRepo price range over " << rows << " rows includes NULL or non-finite low/high");
        const double nan = std::numeric_limits<double>::quiet_NaN();
        return domain::contracts::PriceRange{nan, nan};
    }

    domain::contracts::PriceRange priceRange;
    priceRange.low = doubleOrNaN(chunk->GetValue(0, 0));
    priceRange.high = doubleOrNaN(chunk->GetValue(1, 0));
    return priceRange;
}

std::size_t DuckCandleRepo::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = connection_->Query("SELECT COUNT(*) FROM candles");
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"failed to count candles"};
        throw std::runtime_error("DuckCandleRepo count failed: " + errorMessage);
    }

    std::int64_t total = 0;
    if (auto chunk = result->Fetch()) {
        if (chunk->size() > 0) {
            const auto value = chunk->GetValue(0, 0);
            if (!value.IsNull()) {
                total = value.GetValue<std::int64_t>();
            }
        }
    }
    return static_cast<std::size_t>(total);
}

}  // namespace adapters::duckdb
